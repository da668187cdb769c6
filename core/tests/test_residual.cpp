#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "powerdyn/v1/jacobian.hpp"
#include "powerdyn/v1/residual.hpp"
#include "test_systems.hpp"

#include <cmath>

using namespace powerdyn::v1;
using Catch::Approx;

namespace {

Vector evaluate(ResidualEvaluator<Real>& evaluator, const Vector& x, const Vector& dx, Real t = 0.0) {
    Vector out = Vector::Zero(x.size());
    evaluator.evaluate(std::span<Real>(out.data(), static_cast<std::size_t>(out.size())),
                       std::span<const Real>(dx.data(), static_cast<std::size_t>(dx.size())),
                       std::span<const Real>(x.data(), static_cast<std::size_t>(x.size())), t);
    return out;
}

/// Flat start nudged away from symmetric values
Vector perturbed_start(const SimulationInputs& inputs) {
    Vector x = inputs.flat_start();
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        x[i] += 0.01 * std::sin(static_cast<Real>(i + 1));
    }
    return x;
}

}  // namespace

TEST_CASE("v1 residual vanishes at a known operating point", "[v1][residual]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_gen_load_system()));
    ResidualEvaluator<Real> evaluator(inputs);

    const Vector x = test::gen_load_operating_point();
    const Vector out = evaluate(evaluator, x, Vector::Zero(x.size()));

    REQUIRE(out.size() == 4);
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        CHECK(out[i] == Approx(0.0).margin(1e-12));
    }
}

TEST_CASE("v1 residual keeps the inner variables of the last call", "[v1][residual]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_gen_load_system()));
    ResidualEvaluator<Real> evaluator(inputs);

    const Vector x = test::gen_load_operating_point();
    (void)evaluate(evaluator, x, Vector::Zero(4));

    const std::vector<Real>& inner = evaluator.inner_variables(0);
    REQUIRE(inner.size() == generator_var::count);
    CHECK(inner[generator_var::v_r] == Approx(1.0));
    CHECK(inner[generator_var::v_i] == Approx(0.0).margin(1e-14));
    // Governor output feeds the shaft, balanced by the electrical torque
    CHECK(inner[generator_var::tau_m] == Approx(0.5));
    CHECK(inner[generator_var::tau_e] == Approx(0.5));
}

TEST_CASE("v1 residual resolves load and source rows at build time", "[v1][residual]") {
    PowerSystem system = test::make_mixed_system();
    system.buses[2].magnitude = 1.05;
    SimulationInputs inputs(std::make_shared<PowerSystem>(std::move(system)));

    REQUIRE(inputs.loads().size() == 1);
    CHECK(inputs.loads()[0].bus == 2);
    CHECK(inputs.loads()[0].inv_v0_sq == Approx(1.0 / (1.05 * 1.05)));
    REQUIRE(inputs.sources().size() == 1);
    CHECK(inputs.sources()[0].bus == 0);

    ResidualEvaluator<Real> evaluator(inputs);
    const Vector x = perturbed_start(inputs);
    const Vector dx = Vector::Zero(x.size());
    const Vector before = evaluate(evaluator, x, dx);

    // The load impedance stays at the build-time magnitude
    inputs.system().buses[2].magnitude = 0.9;
    const Vector after = evaluate(evaluator, x, dx);
    CHECK((before.array() == after.array()).all());
}

TEST_CASE("v1 residual subtracts dx on differential rows only", "[v1][residual]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_gen_load_system()));
    ResidualEvaluator<Real> evaluator(inputs);

    const Vector x = test::gen_load_operating_point();
    const Vector base = evaluate(evaluator, x, Vector::Zero(4));
    const Vector dx = Vector::Constant(4, 0.25);
    const Vector shifted = evaluate(evaluator, x, dx);

    const auto& diff = inputs.differential_vars();
    for (Eigen::Index i = 0; i < 4; ++i) {
        const Real expected = diff[static_cast<std::size_t>(i)] ? base[i] - 0.25 : base[i];
        CHECK(shifted[i] == Approx(expected).margin(1e-14));
    }
}

TEST_CASE("v1 residual is deterministic across calls and evaluators", "[v1][residual]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_mixed_system()));
    ResidualEvaluator<Real> first(inputs);
    ResidualEvaluator<Real> second(inputs);

    const Vector x = perturbed_start(inputs);
    const Vector dx = Vector::Zero(x.size());

    const Vector a = evaluate(first, x, dx);
    const Vector b = evaluate(first, x, dx);
    const Vector c = evaluate(second, x, dx);

    REQUIRE(a.allFinite());
    CHECK((a.array() == b.array()).all());
    CHECK((a.array() == c.array()).all());
}

TEST_CASE("v1 residual rejects mismatched buffers", "[v1][residual][validation]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_gen_load_system()));
    ResidualEvaluator<Real> evaluator(inputs);

    const Vector x = Vector::Zero(3);
    CHECK_THROWS_AS(evaluate(evaluator, x, x), std::invalid_argument);
}

TEST_CASE("v1 unavailable injections stop injecting current", "[v1][residual]") {
    auto system = std::make_shared<PowerSystem>(test::make_gen_load_system());
    SimulationInputs inputs(system);
    ResidualEvaluator<Real> evaluator(inputs);

    const Vector x = test::gen_load_operating_point();
    system->generators[0].available = false;
    const Vector out = evaluate(evaluator, x, Vector::Zero(4));

    // Only the load current remains at the bus
    CHECK(out[0] == Approx(-0.5));
    CHECK(out[1] == Approx(0.0).margin(1e-14));
    CHECK(out[2] == Approx(0.0).margin(1e-14));
    CHECK(out[3] == Approx(0.0).margin(1e-14));
}

TEST_CASE("v1 automatic differentiation matches finite differences", "[v1][residual][jacobian]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_mixed_system()));
    ResidualEvaluator<Real> evaluator(inputs);
    JacobianEvaluator jacobian(inputs);

    const Vector x = perturbed_start(inputs);
    const Vector dx = Vector::Zero(x.size());
    const Eigen::Index n = x.size();

    Matrix J;
    Vector f;
    jacobian.evaluate(x, dx, 0.0, J, f);
    REQUIRE(J.rows() == n);
    REQUIRE(J.cols() == n);
    CHECK(jacobian.passes() == static_cast<int>((n + ad_chunk_size - 1) / ad_chunk_size));

    const Vector f_ref = evaluate(evaluator, x, dx);
    for (Eigen::Index i = 0; i < n; ++i) {
        CHECK(f[i] == Approx(f_ref[i]).margin(1e-12));
    }

    const Real h = 1e-6;
    for (Eigen::Index j = 0; j < n; ++j) {
        Vector xp = x;
        Vector xm = x;
        xp[j] += h;
        xm[j] -= h;
        const Vector column = (evaluate(evaluator, xp, dx) - evaluate(evaluator, xm, dx)) / (2.0 * h);
        for (Eigen::Index i = 0; i < n; ++i) {
            CHECK(J(i, j) == Approx(column[i]).epsilon(1e-5).margin(1e-4));
        }
    }
}

TEST_CASE("v1 sparse and dense jacobians agree", "[v1][jacobian]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_omib_system()));
    JacobianEvaluator jacobian(inputs);

    const Vector x = perturbed_start(inputs);
    const Vector dx = Vector::Zero(x.size());

    Matrix dense;
    Vector f_dense;
    jacobian.evaluate(x, dx, 0.0, dense, f_dense);

    SparseMatrix sparse;
    Vector f_sparse;
    jacobian.evaluate_sparse(x, dx, 0.0, sparse, f_sparse);

    CHECK((Matrix(sparse) - dense).cwiseAbs().maxCoeff() == Approx(0.0).margin(1e-14));
    CHECK((f_sparse - f_dense).cwiseAbs().maxCoeff() == Approx(0.0).margin(1e-14));
}
