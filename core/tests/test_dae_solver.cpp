#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "powerdyn/v1/dae_solver.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

using namespace powerdyn::v1;
using Catch::Approx;

namespace {

/// x' = -k x (differential), 0 = y - k x (algebraic)
DaeProblem make_decay_problem(std::shared_ptr<Real> k, Real tf = 1.0) {
    DaeProblem problem;
    problem.residual = [k](Vector& out, const Vector& dx, const Vector& x, Real) {
        out.resize(2);
        out[0] = -(*k) * x[0] - dx[0];
        out[1] = x[1] - (*k) * x[0];
    };
    problem.jacobian = [k](const Vector& x, const Vector& dx, Real, SparseMatrix& J, Vector& f) {
        f.resize(2);
        f[0] = -(*k) * x[0] - dx[0];
        f[1] = x[1] - (*k) * x[0];
        std::vector<Eigen::Triplet<Real>> triplets = {
            {0, 0, -(*k)}, {1, 0, -(*k)}, {1, 1, 1.0}};
        J.resize(2, 2);
        J.setFromTriplets(triplets.begin(), triplets.end());
        J.makeCompressed();
    };
    problem.x0 = Vector(2);
    problem.x0 << 1.0, *k;
    problem.dx0 = Vector(2);
    problem.dx0 << -(*k), 0.0;
    problem.tspan = {0.0, tf};
    problem.differential_vars = {true, false};
    return problem;
}

std::size_t count_time(const DaeSolution& solution, Real t) {
    return static_cast<std::size_t>(std::count(solution.time.begin(), solution.time.end(), t));
}

}  // namespace

TEST_CASE("v1 BDF integrates a semi-explicit index-1 DAE", "[v1][dae]") {
    auto k = std::make_shared<Real>(1.0);
    const DaeProblem problem = make_decay_problem(k);
    BdfDaeSolver solver;

    int stop_calls = 0;
    const DaeSolution solution = solver.solve(problem, {}, [&](Real, const Vector&) {
        ++stop_calls;
        return false;
    });

    REQUIRE(solution.success);
    CHECK(solution.status == SolverStatus::Success);
    CHECK(solution.time.front() == 0.0);
    CHECK(solution.time.back() == 1.0);
    CHECK(solution.states.back()[0] == Approx(std::exp(-1.0)).margin(2e-3));
    CHECK(solution.states.back()[1] == Approx(solution.states.back()[0]).margin(1e-6));
    CHECK(std::is_sorted(solution.time.begin(), solution.time.end()));
    CHECK(stop_calls == 1);
    CHECK(solution.statistics.steps > 0);
    CHECK(solution.statistics.events == 0);
}

TEST_CASE("v1 BDF lands on stop times and reinitializes after events", "[v1][dae][events]") {
    auto k = std::make_shared<Real>(1.0);
    const DaeProblem problem = make_decay_problem(k);
    BdfDaeSolver solver;

    const DaeSolution solution = solver.solve(problem, {0.5}, [&](Real t, const Vector&) {
        if (t != 0.5) return false;
        *k = 2.0;
        return true;
    });

    REQUIRE(solution.success);
    CHECK(solution.statistics.events == 1);
    REQUIRE(count_time(solution, 0.5) == 2);

    const auto first = std::find(solution.time.begin(), solution.time.end(), 0.5);
    const auto ix = static_cast<std::size_t>(std::distance(solution.time.begin(), first));
    const Vector& before = solution.states[ix];
    const Vector& after = solution.states[ix + 1];

    // Differential state is continuous, the algebraic one jumps to the new manifold
    CHECK(after[0] == before[0]);
    CHECK(before[1] == Approx(before[0]).margin(1e-6));
    CHECK(after[1] == Approx(2.0 * after[0]).margin(1e-6));

    CHECK(solution.states.back()[0] == Approx(std::exp(-1.5)).margin(3e-3));
}

TEST_CASE("v1 BDF fires events scheduled at the start time", "[v1][dae][events]") {
    auto k = std::make_shared<Real>(1.0);
    const DaeProblem problem = make_decay_problem(k);
    BdfDaeSolver solver;

    std::vector<Real> seen;
    const DaeSolution solution = solver.solve(problem, {0.0}, [&](Real t, const Vector&) {
        seen.push_back(t);
        if (t != 0.0) return false;
        *k = 3.0;
        return true;
    });

    REQUIRE(solution.success);
    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == 0.0);
    CHECK(seen[1] == 1.0);
    CHECK(count_time(solution, 0.0) == 2);
    CHECK(solution.states[1][1] == Approx(3.0).margin(1e-8));
    CHECK(solution.states.back()[0] == Approx(std::exp(-3.0)).margin(2e-3));
}

TEST_CASE("v1 BDF reports invalid problems", "[v1][dae][validation]") {
    auto k = std::make_shared<Real>(1.0);
    BdfDaeSolver solver;

    DaeProblem reversed = make_decay_problem(k);
    reversed.tspan = {1.0, 0.0};
    const DaeSolution a = solver.solve(reversed, {}, {});
    CHECK_FALSE(a.success);
    CHECK(a.failure_reason == "invalid_problem");

    DaeProblem bad_flags = make_decay_problem(k);
    bad_flags.differential_vars = {true};
    const DaeSolution b = solver.solve(bad_flags, {}, {});
    CHECK_FALSE(b.success);
    CHECK(b.failure_reason == "invalid_problem");

    DaeProblem non_finite = make_decay_problem(k);
    non_finite.x0[0] = std::nan("");
    const DaeSolution c = solver.solve(non_finite, {}, {});
    CHECK_FALSE(c.success);
    CHECK(c.status == SolverStatus::NumericalError);
}

TEST_CASE("v1 BDF reports a singular iteration matrix", "[v1][dae][validation]") {
    auto k = std::make_shared<Real>(1.0);
    DaeProblem problem = make_decay_problem(k);

    // Algebraic equation that does not depend on any state
    problem.residual = [k](Vector& out, const Vector& dx, const Vector& x, Real) {
        out.resize(2);
        out[0] = -(*k) * x[0] - dx[0];
        out[1] = 0.0;
    };
    problem.jacobian = [k](const Vector& x, const Vector& dx, Real, SparseMatrix& J, Vector& f) {
        f.resize(2);
        f[0] = -(*k) * x[0] - dx[0];
        f[1] = 0.0;
        std::vector<Eigen::Triplet<Real>> triplets = {{0, 0, -(*k)}};
        J.resize(2, 2);
        J.setFromTriplets(triplets.begin(), triplets.end());
        J.makeCompressed();
    };

    BdfDaeSolver solver;
    const DaeSolution solution = solver.solve(problem, {}, {});
    REQUIRE_FALSE(solution.success);
    CHECK(solution.status == SolverStatus::SingularMatrix);
    CHECK(solution.failure_reason == "newton_failed");
}

TEST_CASE("v1 algebraic consistency solves only algebraic states", "[v1][dae]") {
    auto k = std::make_shared<Real>(4.0);
    const DaeProblem problem = make_decay_problem(k);

    Vector x(2);
    x << 0.5, 0.0;
    const NewtonResult result = solve_algebraic_consistency(problem, x, Vector::Zero(2), 0.0,
                                                            NewtonOptions{});
    REQUIRE(result.success());
    CHECK(result.solution[0] == 0.5);
    CHECK(result.solution[1] == Approx(2.0).margin(1e-10));
}

TEST_CASE("v1 DAE backend factory", "[v1][dae]") {
    CHECK(make_dae_solver(DaeBackend::NativeBdf, {})->backend() == DaeBackend::NativeBdf);
    CHECK(make_dae_solver(DaeBackend::Ida, {})->backend() == DaeBackend::Ida);
    CHECK(std::string(to_string(DaeBackend::Ida)) == "ida");
}

TEST_CASE("v1 IDA backend integrates or reports a missing build", "[v1][dae][sundials]") {
    auto k = std::make_shared<Real>(1.0);
    const DaeProblem problem = make_decay_problem(k);
    IdaDaeSolver solver;

    const DaeSolution solution = solver.solve(problem, {0.5}, {});
    if (!IdaDaeSolver::available()) {
        CHECK_FALSE(solution.success);
        CHECK(solution.failure_reason == "sundials_not_compiled");
        return;
    }

    REQUIRE(solution.success);
    CHECK(solution.time.back() == Approx(1.0));
    CHECK(count_time(solution, 0.5) >= 1);
    CHECK(solution.states.back()[0] == Approx(std::exp(-1.0)).margin(1e-3));
}

TEST_CASE("v1 IDA backend fires events scheduled at the start time", "[v1][dae][events][sundials]") {
    auto k = std::make_shared<Real>(1.0);
    const DaeProblem problem = make_decay_problem(k);
    IdaDaeSolver solver;

    std::vector<Real> seen;
    const DaeSolution solution = solver.solve(problem, {0.0}, [&](Real t, const Vector&) {
        seen.push_back(t);
        if (t != 0.0) return false;
        *k = 3.0;
        return true;
    });
    if (!IdaDaeSolver::available()) {
        CHECK_FALSE(solution.success);
        CHECK(seen.empty());
        return;
    }

    REQUIRE(solution.success);
    CHECK(solution.statistics.events == 1);
    REQUIRE_FALSE(seen.empty());
    CHECK(seen.front() == 0.0);
    CHECK(count_time(solution, 0.0) == 2);
    CHECK(solution.states[1][1] == Approx(3.0).margin(1e-6));
    CHECK(solution.states.back()[0] == Approx(std::exp(-3.0)).margin(1e-3));
}
