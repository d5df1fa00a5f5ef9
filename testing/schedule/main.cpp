// schedule tests
// Beta-range defaults, sweep planning and linear / geometric interpolation.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "schedule/beta_schedule.hpp"
#include "../test_models.hpp"

TEST_CASE("Sweep plans keep the beta count near the granularity") {
    struct Row { long long sweeps; std::size_t spb, nb; };
    const Row rows[] = {
        {1, 1, 1}, {999, 1, 999}, {1000, 1, 1000}, {1999, 1, 1999},
        {2500, 2, 1250}, {3001, 3, 1001}, {100000, 100, 1000},
    };
    for (const auto& r : rows) {
        CAPTURE(r.sweeps);
        const auto p = schedule::plan_sweeps(r.sweeps);
        CHECK(p.sweeps_per_beta == r.spb);
        CHECK(p.num_betas == r.nb);
        CHECK(p.sweeps_per_beta * p.num_betas >= static_cast<std::size_t>(r.sweeps));
    }
    CHECK_THROWS_AS(schedule::plan_sweeps(0), core::ScheduleError);
    CHECK_THROWS_AS(schedule::plan_sweeps(-5), core::ScheduleError);
}

TEST_CASE("Linear schedule starts at hot and stops one step short of cold") {
    const auto b = schedule::make_schedule(schedule::Kind::Linear, {0.1, 1.1}, 10);
    REQUIRE(b.size() == 10);
    for (std::size_t s = 0; s < b.size(); ++s) {
        CAPTURE(s);
        CHECK(b[s] == doctest::Approx(0.1 + 0.1 * static_cast<double>(s)));
    }
    CHECK(b.front() == 0.1);
    CHECK(b.back() < 1.1);
}

TEST_CASE("Geometric schedule has a constant ratio") {
    const auto b = schedule::make_schedule(schedule::Kind::Geometric, {1.0, 1024.0}, 10);
    REQUIRE(b.size() == 10);
    CHECK(b.front() == 1.0);
    for (std::size_t s = 1; s < b.size(); ++s) CHECK(b[s] / b[s - 1] == doctest::Approx(2.0));
    CHECK(b.back() == doctest::Approx(512.0));
}

TEST_CASE("A reversed range anneals from cold back to hot") {
    const auto b = schedule::make_schedule(schedule::Kind::Linear, {2.0, 1.0}, 4);
    REQUIRE(b.size() == 4);
    CHECK(b[0] == 2.0);
    CHECK(b[3] == doctest::Approx(1.25));
}

TEST_CASE("make_schedule rejects unusable inputs") {
    using schedule::Kind;
    CHECK_THROWS_AS(schedule::make_schedule(Kind::Linear, {0.1, 1.0}, 0), core::ScheduleError);
    CHECK_THROWS_AS(schedule::make_schedule(Kind::Geometric, {0.0, 1.0}, 5), core::ScheduleError);
    CHECK_THROWS_AS(schedule::make_schedule(Kind::Linear, {0.1, -1.0}, 5), core::ScheduleError);
    CHECK_THROWS_AS(schedule::make_schedule(Kind::Linear, {0.1, std::numeric_limits<double>::infinity()}, 5),
                    core::ScheduleError);
}

TEST_CASE("Default beta range follows the largest per-variable magnitude") {
    SUBCASE("triangle") {
        const auto r = schedule::default_beta_range(testutil::frustrated_triangle());
        CHECK(r.hot == 0.1);
        CHECK(r.cold == 4.0); // 2 * (0 + 1 + 1)
    }
    SUBCASE("fields only") {
        const model::IsingModel m(2, {1.0, -3.0}, std::vector<model::Coupler>{});
        CHECK(schedule::default_beta_range(m).cold == 6.0);
    }
    SUBCASE("mixed") {
        const model::IsingModel m(3, {0.5, 0.0, 0.0}, {0, 1}, {1, 2}, {-1.0, 2.0});
        CHECK(schedule::default_beta_range(m).cold == 6.0); // variable 1: 1 + 2
    }
    SUBCASE("all zero") {
        const model::IsingModel m(3, {0.0, 0.0, 0.0}, std::vector<model::Coupler>{});
        CHECK(schedule::default_beta_range(m).cold == 1.0);
    }
    SUBCASE("empty") {
        const model::IsingModel m(0, {}, std::vector<model::Coupler>{});
        const auto r = schedule::default_beta_range(m);
        CHECK(r.hot == 0.1);
        CHECK(r.cold == 1.0);
    }
}

TEST_CASE("validate checks the engine-side schedule contract") {
    const std::vector<double> ok{0.1, 0.5, 1.0};
    CHECK_NOTHROW(schedule::validate(ok, 1));
    CHECK_THROWS_AS(schedule::validate(ok, 0), core::ScheduleError);
    CHECK_THROWS_AS(schedule::validate(std::vector<double>{}, 1), core::ScheduleError);
    CHECK_THROWS_AS(schedule::validate(std::vector<double>{1.0, 0.0}, 1), core::ScheduleError);
    CHECK_THROWS_AS(schedule::validate(std::vector<double>{std::nan("")}, 1), core::ScheduleError);
}

TEST_CASE("Schedule kinds parse case-insensitively") {
    CHECK(schedule::parse_kind("Geometric").value() == schedule::Kind::Geometric);
    CHECK(schedule::parse_kind("LINEAR").value() == schedule::Kind::Linear);
    CHECK_FALSE(schedule::parse_kind("exponential").has_value());
    CHECK(std::string(schedule::to_string(schedule::Kind::Geometric)) == "geometric");
}

int main(int argc, char** argv) {
    doctest::Context ctx;
    ctx.setOption("abort-after", 5);
    ctx.applyCommandLine(argc, argv);
    return ctx.run();
}
