#pragma once

// =============================================================================
// powerdyn - DAE Solver Collaborators
// =============================================================================
// The simulation core hands a DaeProblem plus mandatory stop times and an
// event handler to a DaeSolver backend:
// - BdfDaeSolver: native variable-step BDF1/BDF2 with Newton on the AD
//   Jacobian, landing exactly on every stop time;
// - IdaDaeSolver: SUNDIALS IDA (only when built with POWERDYN_HAS_SUNDIALS).
// =============================================================================

#include "powerdyn/v1/integration.hpp"
#include "powerdyn/v1/solver.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace powerdyn::v1 {

// =============================================================================
// Problem and Solution
// =============================================================================

/// out = F(dx, x, t)
using ResidualFunction =
    std::function<void(Vector& out, const Vector& dx, const Vector& x, Real t)>;

/// J = dF/dx at (dx, x, t); `residual` receives F as a by-product
using JacobianFunction =
    std::function<void(const Vector& x, const Vector& dx, Real t, SparseMatrix& J, Vector& residual)>;

struct DaeProblem {
    ResidualFunction residual;
    JacobianFunction jacobian;
    Vector dx0;
    Vector x0;
    std::pair<Real, Real> tspan{0.0, 1.0};
    std::vector<bool> differential_vars;
};

/// Called after the integrator lands on a stop time; may mutate the problem's
/// parameters and returns true when anything changed (discontinuity).
using EventHandler = std::function<bool(Real t, const Vector& x)>;

struct DaeStatistics {
    int steps = 0;
    int rejected_steps = 0;
    int newton_iterations = 0;
    int jacobian_evaluations = 0;
    int residual_evaluations = 0;
    int events = 0;
};

struct DaeSolution {
    std::vector<Real> time;
    std::vector<Vector> states;
    bool success = false;
    SolverStatus status = SolverStatus::NumericalError;
    std::string message;
    std::string failure_reason;
    DaeStatistics statistics;

    [[nodiscard]] std::size_t size() const { return time.size(); }
};

// =============================================================================
// Solver Options and Interface
// =============================================================================

enum class DaeBackend {
    NativeBdf,
    Ida
};

[[nodiscard]] constexpr const char* to_string(DaeBackend backend) noexcept {
    switch (backend) {
        case DaeBackend::NativeBdf: return "bdf";
        case DaeBackend::Ida: return "ida";
    }
    return "unknown";
}

struct DaeSolverOptions {
    Real abstol = 1e-6;
    Real reltol = 1e-4;
    int max_order = 2;
    int max_steps = 500000;
    TimestepConfig timestep;
    NewtonOptions newton = [] {
        NewtonOptions opts;
        opts.max_iterations = 8;
        opts.auto_damping = false;
        opts.track_history = false;
        opts.tolerances.residual_tol = 1e-6;
        return opts;
    }();
};

class DaeSolver {
public:
    virtual ~DaeSolver() = default;

    [[nodiscard]] virtual DaeSolution solve(const DaeProblem& problem,
                                            const std::vector<Real>& tstops,
                                            const EventHandler& on_stop) = 0;

    [[nodiscard]] virtual DaeBackend backend() const = 0;
};

class BdfDaeSolver final : public DaeSolver {
public:
    explicit BdfDaeSolver(DaeSolverOptions options = {}) : options_(std::move(options)) {}

    [[nodiscard]] DaeSolution solve(const DaeProblem& problem,
                                    const std::vector<Real>& tstops,
                                    const EventHandler& on_stop) override;

    [[nodiscard]] DaeBackend backend() const override { return DaeBackend::NativeBdf; }
    [[nodiscard]] const DaeSolverOptions& options() const { return options_; }

private:
    DaeSolverOptions options_;
};

class IdaDaeSolver final : public DaeSolver {
public:
    explicit IdaDaeSolver(DaeSolverOptions options = {}) : options_(std::move(options)) {}

    [[nodiscard]] DaeSolution solve(const DaeProblem& problem,
                                    const std::vector<Real>& tstops,
                                    const EventHandler& on_stop) override;

    [[nodiscard]] DaeBackend backend() const override { return DaeBackend::Ida; }

    /// Whether the binary was built with SUNDIALS
    [[nodiscard]] static bool available() noexcept;

private:
    DaeSolverOptions options_;
};

[[nodiscard]] std::unique_ptr<DaeSolver> make_dae_solver(DaeBackend backend,
                                                         const DaeSolverOptions& options = {});

/// Newton on the algebraic rows with differential states held fixed;
/// used to restore consistency after a discontinuity
[[nodiscard]] NewtonResult solve_algebraic_consistency(const DaeProblem& problem,
                                                       const Vector& x,
                                                       const Vector& dx,
                                                       Real t,
                                                       const NewtonOptions& options);

}  // namespace powerdyn::v1
