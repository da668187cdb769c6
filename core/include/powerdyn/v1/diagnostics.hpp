#pragma once

// =============================================================================
// powerdyn - Errors and Diagnostics
// =============================================================================
// Three distinct channels, never conflated:
// - fatal build-time integrity errors are thrown (IndexingError, BuildError)
//   and no Simulation is returned;
// - recoverable conditions set a status/flag on the result and record a
//   Warning diagnostic;
// - advisories are recorded as Advisory diagnostics and never block work.
// =============================================================================

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace powerdyn::v1 {

/// Malformed device definition detected while building the state index
class IndexingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Any other failure while assembling a Simulation (unknown bus, bad folder, ...)
class BuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class DiagnosticSeverity : std::uint8_t {
    Advisory,
    Warning,
    Error
};

[[nodiscard]] constexpr const char* to_string(DiagnosticSeverity severity) noexcept {
    switch (severity) {
        case DiagnosticSeverity::Advisory: return "advisory";
        case DiagnosticSeverity::Warning: return "warning";
        case DiagnosticSeverity::Error: return "error";
    }
    return "unknown";
}

enum class DiagnosticCode : std::uint8_t {
    InitializationFailed,
    ResetRequired,
    SolverFailure,
    NoReferenceSource,
    SingularAlgebraicJacobian,
    EigenDecompositionFailed,
    PerturbationApplied,
    SnapshotWritten
};

[[nodiscard]] constexpr const char* to_string(DiagnosticCode code) noexcept {
    switch (code) {
        case DiagnosticCode::InitializationFailed: return "initialization_failed";
        case DiagnosticCode::ResetRequired: return "reset_required";
        case DiagnosticCode::SolverFailure: return "solver_failure";
        case DiagnosticCode::NoReferenceSource: return "no_reference_source";
        case DiagnosticCode::SingularAlgebraicJacobian: return "singular_algebraic_jacobian";
        case DiagnosticCode::EigenDecompositionFailed: return "eigen_decomposition_failed";
        case DiagnosticCode::PerturbationApplied: return "perturbation_applied";
        case DiagnosticCode::SnapshotWritten: return "snapshot_written";
    }
    return "unknown";
}

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Advisory;
    DiagnosticCode code = DiagnosticCode::NoReferenceSource;
    std::string message;
};

/// Optional sink notified as diagnostics are produced
using DiagnosticCallback = std::function<void(const Diagnostic&)>;

/// Collects diagnostics and forwards each one to the optional sink
class DiagnosticLog {
public:
    DiagnosticLog() = default;
    explicit DiagnosticLog(DiagnosticCallback sink) : sink_(std::move(sink)) {}

    void set_sink(DiagnosticCallback sink) { sink_ = std::move(sink); }

    const Diagnostic& emit(DiagnosticSeverity severity, DiagnosticCode code, std::string message) {
        entries_.push_back(Diagnostic{severity, code, std::move(message)});
        if (sink_) {
            sink_(entries_.back());
        }
        return entries_.back();
    }

    [[nodiscard]] const std::vector<Diagnostic>& entries() const { return entries_; }
    [[nodiscard]] bool contains(DiagnosticCode code) const {
        for (const auto& d : entries_) {
            if (d.code == code) return true;
        }
        return false;
    }
    void clear() { entries_.clear(); }

private:
    std::vector<Diagnostic> entries_;
    DiagnosticCallback sink_;
};

}  // namespace powerdyn::v1
