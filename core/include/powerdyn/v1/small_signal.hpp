#pragma once

// =============================================================================
// powerdyn - Small-Signal Analysis
// =============================================================================
// Linearizes F(0, x, t) around an operating point, partitions the Jacobian
// into differential (x) and algebraic (y) blocks
//
//   | fx fy |
//   | gx gy |
//
// and eigen-decomposes the reduced Jacobian A = fx - fy * gy^-1 * gx.
// =============================================================================

#include "powerdyn/v1/diagnostics.hpp"
#include "powerdyn/v1/simulation_inputs.hpp"

#include <string>
#include <vector>

namespace powerdyn::v1 {

enum class SmallSignalStatus : std::uint8_t {
    Success,
    SimulationReset,
    SingularAlgebraicJacobian,
    NumericalError
};

[[nodiscard]] constexpr const char* to_string(SmallSignalStatus status) noexcept {
    switch (status) {
        case SmallSignalStatus::Success: return "success";
        case SmallSignalStatus::SimulationReset: return "simulation_reset";
        case SmallSignalStatus::SingularAlgebraicJacobian: return "singular_algebraic_jacobian";
        case SmallSignalStatus::NumericalError: return "numerical_error";
    }
    return "unknown";
}

struct SmallSignalOptions {
    /// Eigenvalues whose real part lies within this band of zero count as zero
    Real stability_tolerance = 1e-6;
};

struct SmallSignalResult {
    SmallSignalStatus status = SmallSignalStatus::NumericalError;
    std::string message;

    Matrix reduced_jacobian;
    ComplexVector eigenvalues;
    ComplexMatrix eigenvectors;  // right eigenvectors, one column per eigenvalue
    bool stable = false;

    Vector operating_point;
    Real time = 0.0;
    std::vector<Index> differential_states;  // global indices, rows/cols of reduced_jacobian
    std::vector<Index> algebraic_states;

    Vector damping;    // -Re / |lambda|, 1 for a zero eigenvalue
    Vector frequency;  // Hz, |Im| / 2 pi

    /// |v_ki w_ik| normalized per mode; rows are states, columns are modes.
    /// Empty when the eigenvector matrix is not invertible.
    Matrix participation_factors;

    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] bool success() const { return status == SmallSignalStatus::Success; }
};

/// Stability verdict: every real part <= tolerance
[[nodiscard]] bool is_small_signal_stable(const ComplexVector& eigenvalues, Real tolerance);

/// Analyze the linearization at `operating_point`, with dx held at zero.
/// Diagnostics are emitted into `log` as well as copied into the result.
[[nodiscard]] SmallSignalResult analyze_small_signal(SimulationInputs& inputs,
                                                     const Vector& operating_point,
                                                     Real time,
                                                     DiagnosticLog& log,
                                                     const SmallSignalOptions& options = {});

}  // namespace powerdyn::v1
