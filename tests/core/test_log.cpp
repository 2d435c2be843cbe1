// octant_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <octant/core/log.hpp>
#include <atomic>
#include <filesystem>
#include <string>
#include <thread>

using namespace octant_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("log_level_name", "[core][log]") {
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::debug)) == "debug");
}

TEST_CASE("Named loggers", "[core][log]") {
    init_logging();

    SECTION("same name returns the same logger") {
        auto a = get_logger("octant_test");
        auto b = get_logger("octant_test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "octant_test");
    }

    SECTION("module loggers") {
        REQUIRE(core_logger()->name() == "octant_core");
        REQUIRE(spatial_logger()->name() == "octant_spatial");
    }

    SECTION("levels") {
        LogConfig config;
        config.level = spdlog::level::warn;
        configure_logging(config);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
        REQUIRE(spatial_logger()->level() == spdlog::level::warn);

        set_logger_level("octant_spatial", spdlog::level::trace);
        REQUIRE(spatial_logger()->level() == spdlog::level::trace);
        REQUIRE(core_logger()->level() == spdlog::level::warn);

        set_global_log_level(spdlog::level::info);
        REQUIRE(spatial_logger()->level() == spdlog::level::info);
    }

    flush_all_loggers();
    configure_logging(LogConfig{});
}

TEST_CASE("configure_logging", "[core][log]") {
    SECTION("settings are remembered") {
        LogConfig config;
        config.level = spdlog::level::debug;
        config.console = false;
        configure_logging(config);

        LogConfig current = current_log_config();
        REQUIRE(current.level == spdlog::level::debug);
        REQUIRE_FALSE(current.console);
        REQUIRE_FALSE(current.writes_file());
    }

    SECTION("existing loggers take the new sinks") {
        auto logger = get_logger("octant_sink_test");
        auto dir = std::filesystem::temp_directory_path() / "octant_log_retarget";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        LogConfig config;
        config.console = false;
        config.directory = dir.string();
        configure_logging(config);

        logger->warn("after reconfigure");
        flush_all_loggers();
        REQUIRE(std::filesystem::file_size(dir / "octant.log") > 0);

        configure_logging(LogConfig{});
        std::filesystem::remove_all(dir);
    }

    SECTION("file output") {
        auto dir = std::filesystem::temp_directory_path() / "octant_log_test";
        std::filesystem::create_directories(dir);

        LogConfig config;
        config.console = false;
        config.directory = dir.string();
        configure_logging(config);

        spatial_logger()->info("written to file");
        flush_all_loggers();
        REQUIRE(std::filesystem::exists(dir / "octant.log"));
        REQUIRE(std::filesystem::file_size(dir / "octant.log") > 0);

        configure_logging(LogConfig{});
        std::filesystem::remove_all(dir);
    }

    configure_logging(LogConfig{});
}

TEST_CASE("shutdown_logging", "[core][log]") {
    auto before = get_logger("octant_shutdown_test");
    REQUIRE(spdlog::get("octant_shutdown_test") == before);

    shutdown_logging();
    REQUIRE(spdlog::get("octant_shutdown_test") == nullptr);

    auto after = get_logger("octant_shutdown_test");
    REQUIRE(after != before);
    REQUIRE(spatial_logger()->name() == "octant_spatial");
}

TEST_CASE("configure_logging while another thread logs", "[core][log]") {
    auto dir = std::filesystem::temp_directory_path() / "octant_log_concurrent";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    LogConfig to_file;
    to_file.level = spdlog::level::trace;
    to_file.console = false;
    to_file.directory = dir.string();

    LogConfig silent = to_file;
    silent.directory.clear();

    configure_logging(to_file);
    auto logger = spatial_logger();

    std::atomic<bool> done{false};
    std::atomic<int> written{0};
    std::thread writer([&]() {
        while (!done.load()) {
            logger->trace("plane query over {} entities", written.load());
            written.fetch_add(1);
        }
    });

    for (int i = 0; i < 200; ++i) {
        configure_logging(i % 2 == 0 ? silent : to_file);
    }
    configure_logging(to_file);
    done.store(true);
    writer.join();

    logger->trace("final line");
    flush_all_loggers();
    REQUIRE(written.load() > 0);
    REQUIRE(std::filesystem::file_size(dir / "octant.log") > 0);

    configure_logging(LogConfig{});
    std::filesystem::remove_all(dir);
}
