// octant_spatial PlaneIntersection tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <octant/spatial/plane_intersection.hpp>
#include <octant/spatial/plane_query.hpp>
#include <octant/math/math.hpp>
#include <algorithm>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace octant_spatial;
using namespace octant_math;
using Catch::Matchers::WithinAbs;

namespace {

using TestIntersection = PlaneIntersection<std::string, int>;

TestIntersection make(const std::string& id, float distance,
                      PlaneIntersectionType type = PlaneIntersectionType::PositiveSide) {
    return TestIntersection(id, 0, distance, Vec3(0.0f), type, AABB::from_point(Vec3(0.0f)));
}

} // anonymous namespace

// =============================================================================
// PlaneIntersectionType Tests
// =============================================================================

TEST_CASE("PlaneIntersectionType names", "[spatial][plane_intersection]") {
    REQUIRE(std::string(to_string(PlaneIntersectionType::PositiveSide)) == "POSITIVE_SIDE");
    REQUIRE(std::string(to_string(PlaneIntersectionType::NegativeSide)) == "NEGATIVE_SIDE");
    REQUIRE(std::string(to_string(PlaneIntersectionType::Intersecting)) == "INTERSECTING");
    REQUIRE(std::string(to_string(PlaneIntersectionType::OnPlane)) == "ON_PLANE");

    std::ostringstream oss;
    oss << PlaneIntersectionType::OnPlane;
    REQUIRE(oss.str() == "ON_PLANE");
}

// =============================================================================
// Accessor Tests
// =============================================================================

TEST_CASE("PlaneIntersection accessors", "[spatial][plane_intersection]") {
    AABB box(Vec3(-1.0f, 0.0f, -1.0f), Vec3(1.0f, 2.0f, 1.0f));
    TestIntersection result("crate", 42, -0.75f, Vec3(1.0f, 2.0f, 3.0f),
                            PlaneIntersectionType::NegativeSide, box);

    REQUIRE(result.entity_id() == "crate");
    REQUIRE(result.content() == 42);
    REQUIRE_THAT(result.distance_from_plane(), WithinAbs(-0.75f, 1e-6f));
    REQUIRE(result.closest_point() == Vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(result.intersection_type() == PlaneIntersectionType::NegativeSide);
    REQUIRE(result.bounds() == box);
}

TEST_CASE("PlaneIntersection takes inconsistent fields as given", "[spatial][plane_intersection]") {
    // Sign and type disagree; construction does not reject it
    TestIntersection result = make("a", -5.0f, PlaneIntersectionType::PositiveSide);
    REQUIRE(result.intersection_type() == PlaneIntersectionType::PositiveSide);
    REQUIRE(result.distance_from_plane() == -5.0f);
    REQUIRE(result.is_on_positive_side());
    REQUIRE_FALSE(result.is_on_negative_side());
}

// =============================================================================
// Side Predicate Tests
// =============================================================================

TEST_CASE("PlaneIntersection side predicates", "[spatial][plane_intersection]") {
    SECTION("PositiveSide") {
        auto r = make("a", 1.0f, PlaneIntersectionType::PositiveSide);
        REQUIRE_FALSE(r.actually_intersects());
        REQUIRE(r.is_on_positive_side());
        REQUIRE_FALSE(r.is_on_negative_side());
    }

    SECTION("NegativeSide") {
        auto r = make("a", -1.0f, PlaneIntersectionType::NegativeSide);
        REQUIRE_FALSE(r.actually_intersects());
        REQUIRE_FALSE(r.is_on_positive_side());
        REQUIRE(r.is_on_negative_side());
    }

    SECTION("Intersecting counts for both sides") {
        auto r = make("a", 0.25f, PlaneIntersectionType::Intersecting);
        REQUIRE(r.actually_intersects());
        REQUIRE(r.is_on_positive_side());
        REQUIRE(r.is_on_negative_side());
    }

    SECTION("OnPlane at distance zero counts for both sides") {
        auto r = make("a", 0.0f, PlaneIntersectionType::OnPlane);
        REQUIRE(r.actually_intersects());
        REQUIRE(r.is_on_positive_side());
        REQUIRE(r.is_on_negative_side());
    }
}

// =============================================================================
// Ordering Tests
// =============================================================================

TEST_CASE("PlaneIntersection ordering by magnitude", "[spatial][plane_intersection]") {
    SECTION("sign is ignored") {
        auto near_neg = make("a", -0.5f);
        auto far_pos = make("b", 2.0f);
        REQUIRE(near_neg.compare(far_pos) < 0);
        REQUIRE(far_pos.compare(near_neg) > 0);
        REQUIRE(near_neg < far_pos);
        REQUIRE_FALSE(far_pos < near_neg);
    }

    SECTION("equal magnitudes compare equal regardless of type") {
        auto a = make("a", 0.5f, PlaneIntersectionType::PositiveSide);
        auto b = make("b", -0.5f, PlaneIntersectionType::NegativeSide);
        REQUIRE(a.compare(b) == 0);
        REQUIRE(b.compare(a) == 0);
        REQUIRE_FALSE(a < b);
        REQUIRE_FALSE(b < a);
    }

    SECTION("reflexive and antisymmetric") {
        std::vector<TestIntersection> items = {
            make("a", 0.0f), make("b", -3.0f), make("c", 1.5f), make("d", -1.5f)
        };
        for (const auto& x : items) {
            REQUIRE(x.compare(x) == 0);
            for (const auto& y : items) {
                REQUIRE(x.compare(y) == -y.compare(x));
            }
        }
    }

    SECTION("stable sort keeps insertion order for ties") {
        std::vector<TestIntersection> results = {
            make("far", -1.0f), make("first", 0.5f), make("second", -0.5f)
        };
        sort_by_distance(results);

        REQUIRE(results[0].entity_id() == "first");
        REQUIRE(results[1].entity_id() == "second");
        REQUIRE(results[2].entity_id() == "far");
    }
}

TEST_CASE("PlaneIntersection ordering of non-finite distances", "[spatial][plane_intersection]") {
    const float inf = std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();

    SECTION("infinity sorts after finite values") {
        auto finite = make("a", 1e30f);
        auto neg_inf = make("b", -inf);
        REQUIRE(finite < neg_inf);
        REQUIRE(neg_inf.compare(make("c", inf)) == 0);
    }

    SECTION("NaN sorts after everything and equals NaN") {
        auto n1 = make("a", nan);
        auto n2 = make("b", -nan);
        auto big = make("c", inf);

        REQUIRE(n1.compare(big) > 0);
        REQUIRE(big.compare(n1) < 0);
        REQUIRE(n1.compare(n2) == 0);
        REQUIRE(n1.compare(n1) == 0);
    }

    SECTION("sorting with NaN is well defined") {
        std::vector<TestIntersection> results = {
            make("nan", nan), make("two", 2.0f), make("inf", inf), make("zero", 0.0f)
        };
        sort_by_distance(results);

        REQUIRE(results[0].entity_id() == "zero");
        REQUIRE(results[1].entity_id() == "two");
        REQUIRE(results[2].entity_id() == "inf");
        REQUIRE(results[3].entity_id() == "nan");
    }
}

// =============================================================================
// Equality and Diagnostics Tests
// =============================================================================

TEST_CASE("PlaneIntersection value equality", "[spatial][plane_intersection]") {
    auto a = make("a", 1.0f);
    auto b = make("a", 1.0f);
    auto c = make("a", 1.0f, PlaneIntersectionType::Intersecting);
    auto d = make("d", 1.0f);

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(a == d);
    // Same magnitude, different values
    REQUIRE(a.compare(d) == 0);
}

TEST_CASE("PlaneIntersection text form", "[spatial][plane_intersection]") {
    TestIntersection result("E1", 7, 1.2345f, Vec3(1.0f, 2.0f, 3.0f),
                            PlaneIntersectionType::Intersecting, AABB::from_point(vec3::ZERO));

    REQUIRE(result.to_string() ==
            "PlaneIntersection[entity=E1, distance=1.235, type=INTERSECTING, point=(1, 2, 3)]");

    std::ostringstream oss;
    oss << result;
    REQUIRE(oss.str() == result.to_string());

    const float inf = std::numeric_limits<float>::infinity();
    TestIntersection degenerate("E2", 0, std::numeric_limits<float>::quiet_NaN(), Vec3(inf, -1.5f, 0.0f),
                                PlaneIntersectionType::NegativeSide, AABB::from_point(vec3::ZERO));
    REQUIRE(degenerate.to_string() ==
            "PlaneIntersection[entity=E2, distance=nan, type=NEGATIVE_SIDE, point=(inf, -1.5, 0)]");

    TestIntersection far("E3", 0, -inf, vec3::ZERO,
                         PlaneIntersectionType::NegativeSide, AABB::from_point(vec3::ZERO));
    REQUIRE(far.to_string() ==
            "PlaneIntersection[entity=E3, distance=-inf, type=NEGATIVE_SIDE, point=(0, 0, 0)]");
}
