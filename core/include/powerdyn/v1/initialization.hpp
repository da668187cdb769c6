#pragma once

// =============================================================================
// powerdyn - Steady-State Initialization
// =============================================================================
// Solves F(0, x, t0) = 0 for all algebraic and differential equations at once,
// starting from a guess, with Newton-Raphson on the AD Jacobian.
// =============================================================================

#include "powerdyn/v1/simulation_inputs.hpp"
#include "powerdyn/v1/solver.hpp"

#include <string>

namespace powerdyn::v1 {

struct InitializationOptions {
    Real time = 0.0;
    NewtonOptions newton = [] {
        NewtonOptions opts;
        opts.max_iterations = 50;
        opts.tolerances.residual_tol = 1e-8;
        return opts;
    }();
};

struct InitializationResult {
    Vector state;
    bool success = false;
    SolverStatus status = SolverStatus::NumericalError;
    int iterations = 0;
    Real residual_norm = 0.0;
    ConvergenceHistory history;
    std::string message;
};

/// Find a steady state consistent with every equation. On failure the result
/// still carries the last Newton iterate, and `success` is false.
[[nodiscard]] InitializationResult initialize_state(SimulationInputs& inputs,
                                                    const Vector& guess,
                                                    const InitializationOptions& options = {});

}  // namespace powerdyn::v1
