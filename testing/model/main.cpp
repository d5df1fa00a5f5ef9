// model tests
// doctest checks for the flat Ising store, the labelled model adapter and the
// problem-file reader.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "core/errors.hpp"
#include "model/bqm.hpp"
#include "model/ising_model.hpp"
#include "model/problem_io.hpp"
#include "../test_models.hpp"

using core::spin_t;

namespace testutil {

// All 2^n spin vectors, index bit i -> variable i (+1 if set).
inline std::vector<std::vector<spin_t>> all_spin_vectors(std::size_t n) {
    std::vector<std::vector<spin_t>> out;
    for (std::uint64_t mask = 0; mask < (1ULL << n); ++mask) {
        std::vector<spin_t> s(n);
        for (std::size_t i = 0; i < n; ++i) s[i] = (mask >> i & 1ULL) ? spin_t(+1) : spin_t(-1);
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace testutil

// -----------------------------------------------------------------------------
// IsingModel
// -----------------------------------------------------------------------------

TEST_CASE("Triangle energies: all-aligned is 3, every other assignment is -1") {
    const auto m = testutil::frustrated_triangle();
    CHECK(m.num_variables() == 3);
    CHECK(m.num_couplers() == 3);
    for (const auto& s : testutil::all_spin_vectors(3)) {
        const bool aligned = (s[0] == s[1] && s[1] == s[2]);
        CAPTURE(int(s[0])); CAPTURE(int(s[1])); CAPTURE(int(s[2]));
        CHECK(m.energy(s) == (aligned ? 3.0 : -1.0));
    }
}

TEST_CASE("Adjacency rows list both endpoints, sorted by neighbor") {
    const model::IsingModel m(4, {0.5, 0.0, -1.0, 2.0}, {3, 0, 2}, {0, 2, 1}, {1.5, -2.0, 0.25});
    REQUIRE(m.degree(0) == 2);
    CHECK(m.neighbors(0)[0] == 2);
    CHECK(m.neighbor_weights(0)[0] == -2.0);
    CHECK(m.neighbors(0)[1] == 3);
    CHECK(m.neighbor_weights(0)[1] == 1.5);
    CHECK(m.degree(1) == 1);
    CHECK(m.degree(2) == 2);
    CHECK(m.degree(3) == 1);

    std::size_t visited = 0;
    double wsum = 0.0;
    m.for_each_neighbor(2, [&](core::index_t, double w) { ++visited; wsum += w; });
    CHECK(visited == 2);
    CHECK(wsum == -1.75);
}

TEST_CASE("Local field matches h + sum J s") {
    const model::IsingModel m(3, {1.0, -2.0, 0.5}, {0, 1}, {1, 2}, {3.0, -1.0});
    const std::vector<spin_t> s{+1, -1, +1};
    CHECK(m.local_field(0, s) == 1.0 + 3.0 * -1.0);
    CHECK(m.local_field(1, s) == -2.0 + 3.0 * 1.0 + -1.0 * 1.0);
    CHECK(m.local_field(2, s) == 0.5 + -1.0 * -1.0);
    CHECK(m.energy(s) == 1.0 + 2.0 + 0.5 + 3.0 * -1.0 + -1.0 * -1.0);
}

#if CORE_HARDENED
TEST_CASE("Hardened build rejects spin vectors of the wrong length") {
    const auto m = testutil::frustrated_triangle();
    const std::vector<spin_t> short_s{+1, -1};
    const std::vector<spin_t> long_s{+1, -1, +1, -1};
    CHECK_THROWS_AS((void)m.energy(short_s), std::runtime_error);
    CHECK_THROWS_AS((void)m.energy(long_s), std::runtime_error);
    CHECK_THROWS_AS((void)m.local_field(0, short_s), std::runtime_error);
    const std::vector<spin_t> ok{+1, -1, +1};
    CHECK_THROWS_AS((void)m.local_field(3, ok), std::runtime_error);
    CHECK(m.energy(ok) == -1.0);
}
#endif

TEST_CASE("Empty model is valid") {
    const model::IsingModel m(0, {}, std::vector<model::Coupler>{});
    CHECK(m.num_variables() == 0);
    CHECK(m.energy(std::vector<spin_t>{}) == 0.0);
}

TEST_CASE("Shape errors are raised at construction") {
    using V = std::vector<core::index_t>;
    using D = std::vector<double>;
    SUBCASE("h length mismatch") {
        CHECK_THROWS_AS(model::IsingModel(3, D{0.0, 0.0}, V{}, V{}, D{}), core::ShapeError);
    }
    SUBCASE("coupler arrays of different lengths") {
        CHECK_THROWS_AS(model::IsingModel(2, D{0.0, 0.0}, V{0}, V{1, 0}, D{1.0}), core::ShapeError);
    }
    SUBCASE("endpoint out of range") {
        CHECK_THROWS_AS(model::IsingModel(2, D{0.0, 0.0}, V{0}, V{2}, D{1.0}), core::ShapeError);
    }
    SUBCASE("self-loop") {
        CHECK_THROWS_AS(model::IsingModel(2, D{0.0, 0.0}, V{1}, V{1}, D{1.0}), core::ShapeError);
    }
    SUBCASE("duplicate edge in reverse orientation") {
        CHECK_THROWS_AS(model::IsingModel(3, D{0.0, 0.0, 0.0}, V{0, 1}, V{1, 0}, D{1.0, 2.0}), core::ShapeError);
    }
    SUBCASE("non-finite bias") {
        CHECK_THROWS_AS(model::IsingModel(1, D{std::numeric_limits<double>::quiet_NaN()}, V{}, V{}, D{}),
                        core::ShapeError);
        CHECK_THROWS_AS(model::IsingModel(2, D{0.0, 0.0}, V{0}, V{1}, D{std::numeric_limits<double>::infinity()}),
                        core::ShapeError);
    }
}

TEST_CASE("ShapeError is an invalid_argument") {
    CHECK_THROWS_AS(model::IsingModel(1, {0.0, 1.0}, std::vector<model::Coupler>{}), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// LabelMap / BinaryQuadraticModel
// -----------------------------------------------------------------------------

TEST_CASE("LabelMap is bidirectional and keeps insertion order") {
    model::LabelMap lm;
    CHECK(lm.insert("b") == 0);
    CHECK(lm.insert("a") == 1);
    CHECK(lm.insert("b") == 0);
    CHECK(lm.size() == 2);
    CHECK(lm.label(1) == "a");
    CHECK(lm.find("a").value() == 1);
    CHECK_FALSE(lm.find("z").has_value());
}

TEST_CASE("Interactions accumulate and are symmetric") {
    model::BinaryQuadraticModel bqm(model::Vartype::Spin);
    bqm.add_interaction("x", "y", 1.0);
    bqm.add_interaction("y", "x", 0.5);
    bqm.add_linear("x", 2.0);
    bqm.add_linear("x", -0.5);
    CHECK(bqm.num_variables() == 2);
    CHECK(bqm.num_interactions() == 1);
    CHECK(bqm.quadratic("x", "y").value() == 1.5);
    CHECK(bqm.quadratic("y", "x").value() == 1.5);
    CHECK(bqm.linear("x") == 1.5);
    CHECK(bqm.linear("y") == 0.0);
    CHECK_THROWS_AS(bqm.add_interaction("x", "x", 1.0), core::ShapeError);
    CHECK_THROWS_AS((void)bqm.linear("nope"), std::out_of_range);
}

TEST_CASE("Binary model and its spin form agree on every assignment") {
    model::BinaryQuadraticModel bqm(model::Vartype::Binary);
    bqm.add_linear("a", 1.0);
    bqm.add_linear("b", -2.0);
    bqm.add_linear("c", 0.5);
    bqm.add_interaction("a", "b", 3.0);
    bqm.add_interaction("b", "c", -1.5);
    bqm.add_interaction("a", "c", 0.25);
    bqm.add_offset(4.0);

    const model::FlatIsing flat = model::flatten(bqm);
    REQUIRE(flat.model.num_variables() == 3);
    CHECK(flat.labels.labels() == bqm.variables());

    for (const auto& s : testutil::all_spin_vectors(3)) {
        std::vector<int> x(3);
        for (std::size_t i = 0; i < 3; ++i) x[i] = model::from_spin(s[i], model::Vartype::Binary);
        CAPTURE(x[0]); CAPTURE(x[1]); CAPTURE(x[2]);
        CHECK(bqm.energy(x) == doctest::Approx(flat.model.energy(s) + flat.offset));
    }
}

TEST_CASE("Spin model flattens without changing biases") {
    model::BinaryQuadraticModel bqm(model::Vartype::Spin);
    bqm.add_linear("p", 0.75);
    bqm.add_interaction("p", "q", -1.0);
    bqm.add_offset(-3.0);
    const model::FlatIsing flat = model::flatten(bqm);
    CHECK(flat.offset == -3.0);
    CHECK(flat.model.linear(0) == 0.75);
    CHECK(flat.model.linear(1) == 0.0);
    REQUIRE(flat.model.num_couplers() == 1);
    CHECK(flat.model.couplers()[0].weight == -1.0);
}

TEST_CASE("Vartype names parse case-insensitively") {
    CHECK(model::parse_vartype("SPIN").value() == model::Vartype::Spin);
    CHECK(model::parse_vartype("binary").value() == model::Vartype::Binary);
    CHECK_FALSE(model::parse_vartype("bool").has_value());
}

// -----------------------------------------------------------------------------
// Problem reader
// -----------------------------------------------------------------------------

TEST_CASE("Problem file: linear, quadratic, offset and comments") {
    std::istringstream in(
        "# triangle with a field\n"
        "a b 1.0\n"
        "b c 1\n"
        "\n"
        "a c 1.0   # closing edge\n"
        "a 0.5\n"
        "b b -0.25\n"
        "offset 2\n"
        "a b 0.5\n");
    const auto bqm = model::read_problem(in, model::Vartype::Spin);
    CHECK(bqm.num_variables() == 3);
    CHECK(bqm.num_interactions() == 3);
    CHECK(bqm.quadratic("a", "b").value() == 1.5);
    CHECK(bqm.linear("a") == 0.5);
    CHECK(bqm.linear("b") == -0.25);
    CHECK(bqm.offset() == 2.0);
}

TEST_CASE("Problem file errors carry the line number") {
    SUBCASE("bad bias") {
        std::istringstream in("a b 1.0\na b x\n");
        try {
            (void)model::read_problem(in, model::Vartype::Spin);
            FAIL("expected ParseError");
        } catch (const core::ParseError& e) {
            CHECK(e.line() == 2);
        }
    }
    SUBCASE("wrong field count") {
        std::istringstream in("a b c 1.0\n");
        CHECK_THROWS_AS((void)model::read_problem(in, model::Vartype::Binary), core::ParseError);
    }
    SUBCASE("non-finite bias") {
        std::istringstream in("a inf\n");
        CHECK_THROWS_AS((void)model::read_problem(in, model::Vartype::Spin), core::ParseError);
    }
}

int main(int argc, char** argv) {
    doctest::Context ctx;
    ctx.setOption("abort-after", 5);
    ctx.applyCommandLine(argc, argv);
    return ctx.run();
}
