// octant_spatial PlaneQueryConfig tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <octant/spatial/config.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace octant_spatial;
using octant_core::ConfigError;
using octant_core::ErrorCode;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Parsing Tests
// =============================================================================

TEST_CASE("PlaneQueryConfig defaults", "[spatial][config]") {
    PlaneQueryConfig config;
    REQUIRE(config.default_tolerance == 0.0f);
    REQUIRE_THAT(config.on_plane_epsilon, WithinAbs(1e-6f, 1e-9f));
    REQUIRE(config.sort_results);
    REQUIRE_THAT(config.tree_margin, WithinAbs(0.05f, 1e-6f));
    REQUIRE(config.validate());
}

TEST_CASE("parse_plane_query_config", "[spatial][config]") {
    SECTION("all keys") {
        auto result = parse_plane_query_config(R"(
[plane_query]
default_tolerance = 0.5
on_plane_epsilon = 1e-3
sort_results = false
tree_margin = 0.25
)");
        REQUIRE(result.is_ok());
        REQUIRE_THAT(result->default_tolerance, WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(result->on_plane_epsilon, WithinAbs(1e-3f, 1e-9f));
        REQUIRE_FALSE(result->sort_results);
        REQUIRE_THAT(result->tree_margin, WithinAbs(0.25f, 1e-6f));
    }

    SECTION("integers are accepted for floats") {
        auto result = parse_plane_query_config("[plane_query]\ndefault_tolerance = 2\n");
        REQUIRE(result.is_ok());
        REQUIRE(result->default_tolerance == 2.0f);
    }

    SECTION("missing table keeps defaults") {
        auto result = parse_plane_query_config("[other]\nvalue = 1\n");
        REQUIRE(result.is_ok());
        REQUIRE(result->default_tolerance == 0.0f);
        REQUIRE(result->sort_results);
    }

    SECTION("malformed document") {
        auto result = parse_plane_query_config("[plane_query\ndefault_tolerance = ", "broken.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(result.error().as<ConfigError>()->source == "broken.toml");
    }

    SECTION("wrong value type") {
        auto result = parse_plane_query_config("[plane_query]\nsort_results = \"yes\"\n", "typed.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().as<ConfigError>()->key == "sort_results");

        auto* source = result.error().get_context("source");
        REQUIRE(source != nullptr);
        REQUIRE(*source == "typed.toml");
    }

    SECTION("negative epsilon is rejected") {
        auto result = parse_plane_query_config("[plane_query]\non_plane_epsilon = -1.0\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "on_plane_epsilon");
    }

    SECTION("non-finite tolerance is rejected") {
        auto result = parse_plane_query_config("[plane_query]\ndefault_tolerance = inf\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "default_tolerance");
    }
}

// =============================================================================
// File Loading Tests
// =============================================================================

TEST_CASE("load_plane_query_config", "[spatial][config]") {
    SECTION("missing file") {
        auto result = load_plane_query_config("/nonexistent/octant/plane_query.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }

    SECTION("file on disk") {
        auto path = std::filesystem::temp_directory_path() / "octant_test_plane_query.toml";
        {
            std::ofstream out(path);
            out << "[plane_query]\ntree_margin = 0.5\n";
        }

        auto result = load_plane_query_config(path);
        std::filesystem::remove(path);

        REQUIRE(result.is_ok());
        REQUIRE_THAT(result->tree_margin, WithinAbs(0.5f, 1e-6f));
    }
}

// =============================================================================
// Logging Table Tests
// =============================================================================

TEST_CASE("parse_log_config", "[spatial][config][log]") {
    SECTION("missing table keeps defaults") {
        auto result = parse_log_config("[plane_query]\nsort_results = true\n");
        REQUIRE(result.is_ok());
        REQUIRE(result->level == spdlog::level::info);
        REQUIRE(result->console);
        REQUIRE_FALSE(result->writes_file());
    }

    SECTION("all keys") {
        auto result = parse_log_config(R"(
[logging]
level = "warning"
console = false
directory = "logs"
max_file_size = 1024
max_files = 2
)");
        REQUIRE(result.is_ok());
        REQUIRE(result->level == spdlog::level::warn);
        REQUIRE_FALSE(result->console);
        REQUIRE(result->directory == "logs");
        REQUIRE(result->writes_file());
        REQUIRE(result->max_file_size == 1024);
        REQUIRE(result->max_files == 2);
    }

    SECTION("unknown level") {
        auto result = parse_log_config("[logging]\nlevel = \"chatty\"\n", "levels.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().as<ConfigError>()->key == "level");
        REQUIRE(*result.error().get_context("source") == "levels.toml");
    }

    SECTION("zero file count") {
        auto result = parse_log_config("[logging]\nmax_files = 0\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "max_files");
    }

    SECTION("malformed document") {
        auto result = parse_log_config("[logging\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("apply_log_config_file", "[spatial][config][log]") {
    SECTION("missing file") {
        auto result = apply_log_config_file("/nonexistent/octant/logging.toml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }

    SECTION("file on disk") {
        auto path = std::filesystem::temp_directory_path() / "octant_test_logging.toml";
        {
            std::ofstream out(path);
            out << "[logging]\nlevel = \"error\"\n";
        }

        auto result = apply_log_config_file(path);
        std::filesystem::remove(path);

        REQUIRE(result.is_ok());
        REQUIRE(octant_core::get_global_log_level() == spdlog::level::err);
        REQUIRE(octant_core::spatial_logger()->level() == spdlog::level::err);

        octant_core::configure_logging(octant_core::LogConfig{});
    }
}
