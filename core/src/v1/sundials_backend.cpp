#include "powerdyn/v1/dae_solver.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

#ifdef POWERDYN_HAS_SUNDIALS
#include <ida/ida.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_context.h>
#include <sunlinsol/sunlinsol_dense.h>
#include <sunmatrix/sunmatrix_dense.h>
#endif

namespace powerdyn::v1 {

namespace {

#ifdef POWERDYN_HAS_SUNDIALS

[[nodiscard]] SolverStatus map_failure_status(int flag) {
    if (flag >= 0) {
        return SolverStatus::Success;
    }
    if (flag == IDA_TOO_MUCH_WORK) {
        return SolverStatus::MaxIterationsReached;
    }
    if (flag == IDA_CONV_FAIL || flag == IDA_NCONV_FAIL) {
        return SolverStatus::Diverging;
    }
    if (flag == IDA_LSETUP_FAIL || flag == IDA_LSOLVE_FAIL) {
        return SolverStatus::SingularMatrix;
    }
    return SolverStatus::NumericalError;
}

struct IdaUserData {
    const DaeProblem* problem = nullptr;
    std::size_t dimension = 0;
    Vector x;
    Vector dx;
    Vector f;
    SparseMatrix J;
    std::string last_error;
};

[[nodiscard]] bool load_state(N_Vector v, std::size_t n, Vector& out) {
    const auto* data = N_VGetArrayPointer(v);
    if (!data) return false;
    out.resize(static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i) {
        out[static_cast<Eigen::Index>(i)] = static_cast<Real>(data[i]);
    }
    return true;
}

[[nodiscard]] bool store_state(N_Vector v, const Vector& in) {
    auto* data = N_VGetArrayPointer(v);
    if (!data) return false;
    for (Eigen::Index i = 0; i < in.size(); ++i) {
        data[i] = static_cast<sunrealtype>(in[i]);
    }
    return true;
}

[[nodiscard]] int ida_residual(sunrealtype t, N_Vector y, N_Vector yp, N_Vector rr, void* user_data) {
    auto* data = static_cast<IdaUserData*>(user_data);
    if (!data || !data->problem) {
        return -1;
    }
    if (!load_state(y, data->dimension, data->x) || !load_state(yp, data->dimension, data->dx)) {
        data->last_error = "failed to read IDA vectors";
        return -1;
    }
    data->problem->residual(data->f, data->dx, data->x, static_cast<Real>(t));
    if (!data->f.allFinite()) {
        // Recoverable failure: let IDA retry with a smaller step.
        data->last_error = "non-finite residual";
        return 1;
    }
    if (!store_state(rr, data->f)) {
        data->last_error = "failed to write IDA residual vector";
        return -1;
    }
    return 0;
}

/// J = dF/dy + cj dF/dyp, with dF/dyp = -I on differential rows
[[nodiscard]] int ida_jacobian(sunrealtype t, sunrealtype cj, N_Vector y, N_Vector yp,
                               N_Vector /*rr*/, SUNMatrix jac, void* user_data,
                               N_Vector /*tmp1*/, N_Vector /*tmp2*/, N_Vector /*tmp3*/) {
    auto* data = static_cast<IdaUserData*>(user_data);
    if (!data || !data->problem) {
        return -1;
    }
    if (!load_state(y, data->dimension, data->x) || !load_state(yp, data->dimension, data->dx)) {
        data->last_error = "failed to read IDA vectors for the Jacobian";
        return -1;
    }
    data->problem->jacobian(data->x, data->dx, static_cast<Real>(t), data->J, data->f);
    SUNMatZero(jac);
    for (Eigen::Index col = 0; col < data->J.outerSize(); ++col) {
        for (SparseMatrix::InnerIterator it(data->J, col); it; ++it) {
            SM_ELEMENT_D(jac, it.row(), col) = static_cast<sunrealtype>(it.value());
        }
    }
    for (std::size_t i = 0; i < data->dimension; ++i) {
        if (data->problem->differential_vars[i]) {
            const auto k = static_cast<sunindextype>(i);
            SM_ELEMENT_D(jac, k, k) -= cj;
        }
    }
    return 0;
}

#endif  // POWERDYN_HAS_SUNDIALS

}  // namespace

bool IdaDaeSolver::available() noexcept {
#ifdef POWERDYN_HAS_SUNDIALS
    return true;
#else
    return false;
#endif
}

DaeSolution IdaDaeSolver::solve(const DaeProblem& problem,
                                const std::vector<Real>& tstops,
                                const EventHandler& on_stop) {
    DaeSolution solution;

#ifndef POWERDYN_HAS_SUNDIALS
    (void)problem;
    (void)tstops;
    (void)on_stop;
    solution.success = false;
    solution.status = SolverStatus::NumericalError;
    solution.message = "IDA backend requested but binary was built without SUNDIALS support";
    solution.failure_reason = "sundials_not_compiled";
    return solution;
#else
    const std::size_t n = static_cast<std::size_t>(problem.x0.size());
    if (n == 0 || !problem.residual || !problem.jacobian ||
        problem.differential_vars.size() != n || !(problem.tspan.second > problem.tspan.first)) {
        solution.status = SolverStatus::NumericalError;
        solution.message = "IDA backend received an invalid problem";
        solution.failure_reason = "invalid_problem";
        return solution;
    }

    const Real t0 = problem.tspan.first;
    const Real tf = problem.tspan.second;
    std::vector<Real> stops;
    for (const Real s : tstops) {
        if (s > t0 && s < tf) stops.push_back(s);
    }
    stops.push_back(tf);
    std::sort(stops.begin(), stops.end());
    stops.erase(std::unique(stops.begin(), stops.end()), stops.end());

    SUNContext sunctx = nullptr;
    if (SUNContext_Create(nullptr, &sunctx) != 0 || sunctx == nullptr) {
        solution.status = SolverStatus::NumericalError;
        solution.message = "SUNDIALS context creation failed";
        solution.failure_reason = "sundials_context_create_failed";
        return solution;
    }

    N_Vector y = N_VNew_Serial(static_cast<sunindextype>(n), sunctx);
    N_Vector yp = N_VNew_Serial(static_cast<sunindextype>(n), sunctx);
    N_Vector ida_id = N_VNew_Serial(static_cast<sunindextype>(n), sunctx);
    SUNMatrix jac = nullptr;
    SUNLinearSolver linear_solver = nullptr;
    void* solver_mem = nullptr;

    auto cleanup = [&]() {
        if (solver_mem) IDAFree(&solver_mem);
        if (linear_solver) SUNLinSolFree(linear_solver);
        if (jac) SUNMatDestroy(jac);
        if (ida_id) N_VDestroy(ida_id);
        if (yp) N_VDestroy(yp);
        if (y) N_VDestroy(y);
        if (sunctx) SUNContext_Free(&sunctx);
    };

    auto fail = [&](SolverStatus status, std::string reason, std::string message) {
        cleanup();
        solution.success = false;
        solution.status = status;
        solution.failure_reason = std::move(reason);
        solution.message = std::move(message);
        return solution;
    };

    if (!y || !yp || !ida_id) {
        return fail(SolverStatus::NumericalError, "sundials_vector_allocation_failed",
                    "SUNDIALS vector allocation failed");
    }

    IdaUserData user_data;
    user_data.problem = &problem;
    user_data.dimension = n;

    (void)store_state(y, problem.x0);
    (void)store_state(yp, problem.dx0);
    Vector id_values(static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i) {
        id_values[static_cast<Eigen::Index>(i)] = problem.differential_vars[i] ? 1.0 : 0.0;
    }
    (void)store_state(ida_id, id_values);

    solver_mem = IDACreate(sunctx);
    if (!solver_mem) {
        return fail(SolverStatus::NumericalError, "sundials_allocation_failed",
                    "SUNDIALS IDA allocation failed");
    }

    int flag = IDAInit(solver_mem, ida_residual, static_cast<sunrealtype>(t0), y, yp);
    if (flag == IDA_SUCCESS) {
        flag = IDASStolerances(solver_mem, static_cast<sunrealtype>(options_.reltol),
                               static_cast<sunrealtype>(options_.abstol));
    }
    if (flag == IDA_SUCCESS) flag = IDASetUserData(solver_mem, &user_data);
    if (flag == IDA_SUCCESS) {
        jac = SUNDenseMatrix(static_cast<sunindextype>(n), static_cast<sunindextype>(n), sunctx);
        linear_solver = jac ? SUNLinSol_Dense(y, jac, sunctx) : nullptr;
        flag = (jac && linear_solver) ? IDASetLinearSolver(solver_mem, linear_solver, jac) : -1;
    }
    if (flag == IDA_SUCCESS) flag = IDASetJacFn(solver_mem, ida_jacobian);
    if (flag == IDA_SUCCESS) flag = IDASetId(solver_mem, ida_id);
    if (flag == IDA_SUCCESS) flag = IDASetMaxNumSteps(solver_mem, options_.max_steps);
    if (flag == IDA_SUCCESS) flag = IDASetMaxOrd(solver_mem, std::max(1, options_.max_order));
    if (flag == IDA_SUCCESS) {
        flag = IDASetMaxStep(solver_mem, static_cast<sunrealtype>(options_.timestep.dt_max));
    }
    if (flag == IDA_SUCCESS) {
        flag = IDASetInitStep(solver_mem, static_cast<sunrealtype>(options_.timestep.dt_initial));
    }
    if (flag != IDA_SUCCESS) {
        return fail(map_failure_status(flag), "sundials_setup_failed",
                    "SUNDIALS IDA setup failed (flag=" + std::to_string(flag) + ")");
    }

    auto calc_ic = [&](Real t) {
        const Real t_probe = std::min(t + options_.timestep.dt_initial, tf);
        const int ic_flag = IDACalcIC(solver_mem, IDA_YA_YDP_INIT, static_cast<sunrealtype>(t_probe));
        if (ic_flag == IDA_SUCCESS) {
            return IDAGetConsistentIC(solver_mem, y, yp);
        }
        return ic_flag;
    };

    flag = calc_ic(t0);
    if (flag != IDA_SUCCESS) {
        return fail(map_failure_status(flag), "calc_ic_failed",
                    "IDACalcIC failed at t=" + std::to_string(t0));
    }

    Vector state;
    (void)load_state(y, n, state);
    solution.time.push_back(t0);
    solution.states.push_back(state);

    // Perturbations scheduled exactly at the start time
    if (on_stop && std::find(tstops.begin(), tstops.end(), t0) != tstops.end() && on_stop(t0, state)) {
        ++solution.statistics.events;
        flag = IDAReInit(solver_mem, static_cast<sunrealtype>(t0), y, yp);
        if (flag == IDA_SUCCESS) flag = calc_ic(t0);
        if (flag != IDA_SUCCESS) {
            return fail(map_failure_status(flag), "reinitialization_failed",
                        "IDA reinitialization failed at t=" + std::to_string(t0));
        }
        (void)load_state(y, n, state);
        solution.time.push_back(t0);
        solution.states.push_back(state);
    }

    Real t = t0;
    for (const Real stop : stops) {
        flag = IDASetStopTime(solver_mem, static_cast<sunrealtype>(stop));
        if (flag != IDA_SUCCESS) {
            return fail(map_failure_status(flag), "sundials_stop_time_failed",
                        "IDASetStopTime failed for t=" + std::to_string(stop));
        }

        while (t < stop) {
            sunrealtype tret = static_cast<sunrealtype>(t);
            flag = IDASolve(solver_mem, static_cast<sunrealtype>(stop), &tret, y, yp, IDA_ONE_STEP);
            if (flag < 0) {
                std::ostringstream oss;
                oss << "SUNDIALS IDA solve failed (flag=" << flag << ")";
                if (!user_data.last_error.empty()) {
                    oss << ": " << user_data.last_error;
                }
                return fail(map_failure_status(flag), "sundials_step_failed", oss.str());
            }
            t = flag == IDA_TSTOP_RETURN ? stop : static_cast<Real>(tret);
            (void)load_state(y, n, state);
            solution.time.push_back(t);
            solution.states.push_back(state);
        }

        if (on_stop && on_stop(t, state)) {
            ++solution.statistics.events;
            flag = IDAReInit(solver_mem, static_cast<sunrealtype>(t), y, yp);
            if (flag == IDA_SUCCESS && t < tf) flag = calc_ic(t);
            if (flag != IDA_SUCCESS) {
                return fail(map_failure_status(flag), "reinitialization_failed",
                            "IDA reinitialization failed at t=" + std::to_string(t));
            }
            (void)load_state(y, n, state);
            solution.time.push_back(t);
            solution.states.push_back(state);
        }
    }

    long int steps = 0;
    long int nonlinear_iters = 0;
    long int residual_evals = 0;
    long int jacobian_evals = 0;
    long int error_test_fails = 0;
    IDAGetNumSteps(solver_mem, &steps);
    IDAGetNumNonlinSolvIters(solver_mem, &nonlinear_iters);
    IDAGetNumResEvals(solver_mem, &residual_evals);
    IDAGetNumJacEvals(solver_mem, &jacobian_evals);
    IDAGetNumErrTestFails(solver_mem, &error_test_fails);
    solution.statistics.steps = static_cast<int>(steps);
    solution.statistics.newton_iterations = static_cast<int>(nonlinear_iters);
    solution.statistics.residual_evaluations = static_cast<int>(residual_evals);
    solution.statistics.jacobian_evaluations = static_cast<int>(jacobian_evals);
    solution.statistics.rejected_steps = static_cast<int>(error_test_fails);

    cleanup();
    solution.success = true;
    solution.status = SolverStatus::Success;
    return solution;
#endif
}

}  // namespace powerdyn::v1
