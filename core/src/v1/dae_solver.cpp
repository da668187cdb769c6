#include "powerdyn/v1/dae_solver.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace powerdyn::v1 {

namespace {

/// dx consistent with x: F(0, x, t) on differential rows, zero elsewhere
Vector consistent_derivative(const DaeProblem& problem, const Vector& x, Real t) {
    const Eigen::Index n = x.size();
    Vector zero = Vector::Zero(n);
    Vector f(n);
    problem.residual(f, zero, x, t);
    Vector dx = Vector::Zero(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (problem.differential_vars[static_cast<std::size_t>(i)]) {
            dx[i] = f[i];
        }
    }
    return dx;
}

std::vector<Real> collect_stops(const std::vector<Real>& tstops, Real t0, Real tf) {
    std::vector<Real> stops;
    for (const Real s : tstops) {
        if (s > t0 && s < tf) stops.push_back(s);
    }
    stops.push_back(tf);
    std::sort(stops.begin(), stops.end());
    stops.erase(std::unique(stops.begin(), stops.end()), stops.end());
    return stops;
}

DaeSolution& fail(DaeSolution& solution, SolverStatus status, std::string reason, std::string message) {
    solution.success = false;
    solution.status = status;
    solution.failure_reason = std::move(reason);
    solution.message = std::move(message);
    return solution;
}

std::string validate(const DaeProblem& problem) {
    const Eigen::Index n = problem.x0.size();
    if (!problem.residual || !problem.jacobian) return "residual and jacobian callbacks are required";
    if (problem.dx0.size() != n) return "dx0 and x0 sizes differ";
    if (problem.differential_vars.size() != static_cast<std::size_t>(n)) {
        return "differential_vars size differs from the state size";
    }
    if (!(problem.tspan.second > problem.tspan.first)) return "tspan must be increasing";
    if (!problem.x0.allFinite()) return "initial state is not finite";
    return {};
}

}  // namespace

// =============================================================================
// Algebraic consistency
// =============================================================================

NewtonResult solve_algebraic_consistency(const DaeProblem& problem,
                                         const Vector& x,
                                         const Vector& dx,
                                         Real t,
                                         const NewtonOptions& options) {
    std::vector<Index> algebraic;
    std::vector<Index> position(static_cast<std::size_t>(x.size()), -1);
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        if (!problem.differential_vars[static_cast<std::size_t>(i)]) {
            position[static_cast<std::size_t>(i)] = static_cast<Index>(algebraic.size());
            algebraic.push_back(static_cast<Index>(i));
        }
    }

    const auto m = static_cast<Index>(algebraic.size());
    Vector z0(m);
    for (Index k = 0; k < m; ++k) z0[k] = x[algebraic[static_cast<std::size_t>(k)]];

    NewtonOptions opts = options;
    opts.max_iterations = std::max(opts.max_iterations, 20);
    opts.auto_damping = true;
    NewtonRaphsonSolver<> newton(opts);

    Vector full = x;
    Vector f_full(x.size());
    SparseMatrix J_full;

    auto system = [&](const Vector& z, Vector& f, SparseMatrix& J, bool need_jacobian) {
        for (Index k = 0; k < m; ++k) full[algebraic[static_cast<std::size_t>(k)]] = z[k];
        if (need_jacobian) {
            problem.jacobian(full, dx, t, J_full, f_full);
            std::vector<Eigen::Triplet<Real>> triplets;
            for (Eigen::Index col = 0; col < J_full.outerSize(); ++col) {
                const Index c = position[static_cast<std::size_t>(col)];
                if (c < 0) continue;
                for (SparseMatrix::InnerIterator it(J_full, col); it; ++it) {
                    const Index r = position[static_cast<std::size_t>(it.row())];
                    if (r >= 0) triplets.emplace_back(r, c, it.value());
                }
            }
            J.resize(m, m);
            J.setFromTriplets(triplets.begin(), triplets.end());
            J.makeCompressed();
        } else {
            problem.residual(f_full, dx, full, t);
        }
        f.resize(m);
        for (Index k = 0; k < m; ++k) f[k] = f_full[algebraic[static_cast<std::size_t>(k)]];
    };

    NewtonResult result;
    if (m == 0) {
        result.solution = x;
        result.status = SolverStatus::Success;
        return result;
    }
    result = newton.solve(z0, system);
    Vector solved = x;
    for (Index k = 0; k < m; ++k) solved[algebraic[static_cast<std::size_t>(k)]] = result.solution[k];
    result.solution = std::move(solved);
    return result;
}

// =============================================================================
// Native BDF integrator
// =============================================================================

DaeSolution BdfDaeSolver::solve(const DaeProblem& problem,
                                const std::vector<Real>& tstops,
                                const EventHandler& on_stop) {
    DaeSolution solution;
    if (const std::string error = validate(problem); !error.empty()) {
        return fail(solution, SolverStatus::NumericalError, "invalid_problem", error);
    }

    const Eigen::Index n = problem.x0.size();
    const Real t0 = problem.tspan.first;
    const Real tf = problem.tspan.second;
    const std::vector<Real> stops = collect_stops(tstops, t0, tf);
    const Real dt_min = options_.timestep.dt_min;
    DaeStatistics& stats = solution.statistics;

    Real t = t0;
    Vector x = problem.x0;
    solution.time.push_back(t);
    solution.states.push_back(x);

    // Perturbations scheduled exactly at the start time
    if (on_stop && std::find(tstops.begin(), tstops.end(), t0) != tstops.end() && on_stop(t, x)) {
        ++stats.events;
        const NewtonResult reinit = solve_algebraic_consistency(problem, x, problem.dx0, t,
                                                                options_.newton);
        if (!reinit.success()) {
            return fail(solution, reinit.status, "reinitialization_failed",
                        "algebraic reinitialization failed at t=" + std::to_string(t) + ": " +
                            reinit.error_message);
        }
        x = reinit.solution;
        solution.time.push_back(t);
        solution.states.push_back(x);
    }

    Vector dx = consistent_derivative(problem, x, t);
    ++stats.residual_evaluations;
    Vector x_prev = x;
    Vector dx_prev = dx;
    Real h_prev = 0.0;
    bool have_history = false;
    int order = 1;

    PITimestepController controller(options_.timestep);
    NewtonRaphsonSolver<> newton(options_.newton);
    std::size_t stop_ix = 0;

    while (t < tf) {
        if (stats.steps + stats.rejected_steps >= options_.max_steps) {
            return fail(solution, SolverStatus::MaxIterationsReached, "too_much_work",
                        "maximum number of steps reached at t=" + std::to_string(t));
        }

        const Real t_stop = stops[stop_ix];
        const Real h = PITimestepController::clip_to_stop(t, controller.current_dt(), t_stop, dt_min);
        const bool lands = h == t_stop - t;
        const Real t_new = lands ? t_stop : t + h;

        const BDFCoeffs coeffs = (order >= 2 && have_history) ? BDFCoeffs::bdf2(h / h_prev)
                                                              : BDFCoeffs::bdf1();
        Vector x_pred = x + h * dx;
        if (coeffs.order == 2) {
            x_pred += (0.5 * h * h / h_prev) * (dx - dx_prev);
        }
        const Vector history = coeffs.alpha[1] * x + coeffs.alpha[2] * x_prev;
        const Real a0_h = coeffs.alpha[0] / h;

        auto system = [&](const Vector& z, Vector& f, SparseMatrix& J, bool need_jacobian) {
            const Vector dz = (coeffs.alpha[0] * z + history) / h;
            if (need_jacobian) {
                problem.jacobian(z, dz, t_new, J, f);
                ++stats.jacobian_evaluations;
                // Iteration matrix dF/dx - (alpha0 / h) dF/d(dx)
                for (Eigen::Index i = 0; i < n; ++i) {
                    if (problem.differential_vars[static_cast<std::size_t>(i)]) {
                        J.coeffRef(i, i) -= a0_h;
                    }
                }
                J.makeCompressed();
            } else {
                problem.residual(f, dz, z, t_new);
                ++stats.residual_evaluations;
            }
        };

        const NewtonResult step = newton.solve(x_pred, system);
        stats.newton_iterations += step.iterations;

        if (!step.success()) {
            ++stats.rejected_steps;
            order = 1;
            controller.reject_nonconvergence();
            if (controller.failed() || h <= dt_min) {
                std::ostringstream oss;
                oss << "Newton failed at t=" << t_new << " with h=" << h << ": "
                    << step.error_message;
                return fail(solution, step.status, "newton_failed", oss.str());
            }
            continue;
        }

        const Real error = weighted_local_error(step.solution, x_pred, problem.differential_vars,
                                                coeffs.error_constant(), options_.abstol,
                                                options_.reltol);
        const TimestepDecision decision = controller.compute(error, coeffs.order);
        if (!decision.accepted) {
            ++stats.rejected_steps;
            if (controller.failed() || h <= dt_min) {
                std::ostringstream oss;
                oss << "error test failed repeatedly at t=" << t_new << " with h=" << h;
                return fail(solution, SolverStatus::NumericalError, "error_test_failed", oss.str());
            }
            continue;
        }

        // Accept
        x_prev = x;
        dx_prev = dx;
        h_prev = h;
        x = step.solution;
        dx = (coeffs.alpha[0] * x + history) / h;
        t = t_new;
        have_history = true;
        ++stats.steps;
        solution.time.push_back(t);
        solution.states.push_back(x);
        controller.accept(decision.dt_new);
        order = std::min(order + 1, options_.max_order);

        if (!lands) continue;
        ++stop_ix;

        if (on_stop && on_stop(t, x)) {
            ++stats.events;
            const NewtonResult reinit = solve_algebraic_consistency(problem, x, dx, t, options_.newton);
            if (!reinit.success()) {
                return fail(solution, reinit.status, "reinitialization_failed",
                            "algebraic reinitialization failed at t=" + std::to_string(t) + ": " +
                                reinit.error_message);
            }
            x = reinit.solution;
            solution.time.push_back(t);
            solution.states.push_back(x);

            dx = consistent_derivative(problem, x, t);
            ++stats.residual_evaluations;
            x_prev = x;
            dx_prev = dx;
            have_history = false;
            order = 1;
            controller.restart();
        }
    }

    solution.success = true;
    solution.status = SolverStatus::Success;
    return solution;
}

std::unique_ptr<DaeSolver> make_dae_solver(DaeBackend backend, const DaeSolverOptions& options) {
    switch (backend) {
        case DaeBackend::NativeBdf: return std::make_unique<BdfDaeSolver>(options);
        case DaeBackend::Ida: return std::make_unique<IdaDaeSolver>(options);
    }
    return std::make_unique<BdfDaeSolver>(options);
}

}  // namespace powerdyn::v1
