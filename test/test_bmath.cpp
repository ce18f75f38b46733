#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>

#include "bmath.hpp"
#include "defines.h"

static double parabola(double x, void* ctx) {
    double center = *static_cast<double*>(ctx);
    return (x - center) * (x - center) + 1;
}

static double line(double x, void*) {
    return x;
}

TEST_CASE("FMinBound finds an interior minimum", "[bmath]") {
    double center = 2;

    CHECK(FMinBound(parabola, &center, 0, 5) == Approx(2).margin(1e-4));

    center = -0.75;
    CHECK(FMinBound(parabola, &center, -1, 1) == Approx(-0.75).margin(1e-4));
}

TEST_CASE("FMinBound stops at the bound of a monotonic function", "[bmath]") {
    CHECK(FMinBound(line, nullptr, 1, 3) == Approx(1).margin(1e-4));
}

TEST_CASE("FMinBound rejects an inverted interval", "[bmath]") {
    double center = 0;
    CHECK_THROWS_AS(FMinBound(parabola, &center, 1, 0), std::invalid_argument);
}

TEST_CASE("TridiagTopEigvec", "[bmath]") {
    SECTION("2x2") {
        auto vec = TridiagTopEigvec({ 2, 2 }, { 1 });

        REQUIRE(vec.size() == 2);
        CHECK(fabs(vec[0]) == Approx(sqrt(0.5)));
        CHECK(fabs(vec[1]) == Approx(sqrt(0.5)));
        CHECK(vec[0] * vec[1] > 0);
    }

    SECTION("diagonal matrix") {
        auto vec = TridiagTopEigvec({ 1, 2, 3 }, { 0, 0 });

        CHECK(fabs(vec[2]) == Approx(1));
        CHECK(fabs(vec[0]) < 1e-8);
        CHECK(fabs(vec[1]) < 1e-8);
    }

    SECTION("path graph") {
        // Largest eigenvector of the 4 node path is sin(k pi / 5)
        auto vec = TridiagTopEigvec({ 0, 0, 0, 0 }, { 1, 1, 1 });

        double sign = vec[0] > 0 ? 1 : -1;
        double norm = sqrt(2.0 / 5);

        for (int k = 0; k < 4; k++)
            CHECK(sign * vec[k] == Approx(norm * sin((k + 1) * M_PI / 5)));
    }

    SECTION("single element") {
        auto vec = TridiagTopEigvec({ 5 }, { });

        REQUIRE(vec.size() == 1);
        CHECK(vec[0] == 1);
    }

    SECTION("bad sizes") {
        CHECK_THROWS_AS(TridiagTopEigvec({ }, { }), std::invalid_argument);
        CHECK_THROWS_AS(TridiagTopEigvec({ 1, 2 }, { }), std::invalid_argument);
    }
}
