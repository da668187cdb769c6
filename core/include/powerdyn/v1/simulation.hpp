#pragma once

// =============================================================================
// powerdyn - Simulation Lifecycle
// =============================================================================
// built -> initialized -> integrated, plus an orthogonal reset flag. Once the
// flag is set (a run applied perturbations, or mark_reset() was called) the
// instance refuses further runs and analyses.
// =============================================================================

#include "powerdyn/v1/dae_solver.hpp"
#include "powerdyn/v1/diagnostics.hpp"
#include "powerdyn/v1/initialization.hpp"
#include "powerdyn/v1/jacobian.hpp"
#include "powerdyn/v1/perturbations.hpp"
#include "powerdyn/v1/small_signal.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace powerdyn::v1 {

struct SimulationOptions {
    std::pair<Real, Real> tspan{0.0, 1.0};
    DaeBackend backend = DaeBackend::NativeBdf;
    DaeSolverOptions solver;

    bool initialize = true;
    std::optional<Vector> initial_guess;  // replaces the flat start entirely
    InitializationOptions initialization;

    bool system_to_file = false;
    std::filesystem::path simulation_folder = ".";

    SmallSignalOptions small_signal;
    DiagnosticCallback diagnostic_callback;
};

enum class SimulationStage : std::uint8_t {
    Built,
    Initialized,
    Integrated
};

[[nodiscard]] constexpr const char* to_string(SimulationStage stage) noexcept {
    switch (stage) {
        case SimulationStage::Built: return "built";
        case SimulationStage::Initialized: return "initialized";
        case SimulationStage::Integrated: return "integrated";
    }
    return "unknown";
}

enum class SimulationStatus : std::uint8_t {
    Success,
    ResetRequired,
    SolverFailure
};

[[nodiscard]] constexpr const char* to_string(SimulationStatus status) noexcept {
    switch (status) {
        case SimulationStatus::Success: return "success";
        case SimulationStatus::ResetRequired: return "reset_required";
        case SimulationStatus::SolverFailure: return "solver_failure";
    }
    return "unknown";
}

struct SimulationRunResult {
    SimulationStatus status = SimulationStatus::Success;
    SolverStatus solver_status = SolverStatus::Success;
    std::string message;
    std::vector<std::string> perturbations_applied;
    DaeStatistics statistics;

    [[nodiscard]] bool success() const { return status == SimulationStatus::Success; }
};

struct TimeSeries {
    std::vector<Real> time;
    std::vector<Real> values;
};

class Simulation {
public:
    /// Build on a copy of `system`; `system_to_file` writes input_system.json.
    /// Throws IndexingError or BuildError; no Simulation exists on failure.
    [[nodiscard]] static Simulation build(const PowerSystem& system,
                                          const std::vector<Perturbation>& perturbations = {},
                                          SimulationOptions options = {});

    /// Build on `system` itself, so perturbations mutate the caller's model;
    /// `system_to_file` writes initialized_system.json after initialization.
    [[nodiscard]] static Simulation build_in_place(std::shared_ptr<PowerSystem> system,
                                                   const std::vector<Perturbation>& perturbations = {},
                                                   SimulationOptions options = {});

    Simulation(Simulation&&) noexcept = default;
    Simulation& operator=(Simulation&&) noexcept = default;
    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    ~Simulation() = default;

    /// Solve for a consistent initial state from the current guess. Failure
    /// leaves the instance usable with the guess and records a warning.
    bool initialize();

    /// Integrate over tspan. Refuses with ResetRequired once reset is set.
    [[nodiscard]] SimulationRunResult run();

    /// Linearize at the initial condition (or at `operating_point`) with dx = 0
    [[nodiscard]] SmallSignalResult small_signal_analysis();
    [[nodiscard]] SmallSignalResult small_signal_analysis(const Vector& operating_point);

    void mark_reset() { reset_ = true; }
    [[nodiscard]] bool requires_reset() const { return reset_; }
    [[nodiscard]] bool initialized() const { return initialized_; }
    [[nodiscard]] SimulationStage stage() const { return stage_; }

    [[nodiscard]] const SimulationOptions& options() const { return options_; }
    [[nodiscard]] SimulationInputs& inputs() { return *inputs_; }
    [[nodiscard]] const SimulationInputs& inputs() const { return *inputs_; }
    [[nodiscard]] const DaeProblem& problem() const { return problem_; }
    [[nodiscard]] const Vector& x0_init() const { return x0_init_; }
    [[nodiscard]] const std::vector<Real>& tstops() const { return plan_.tstops; }
    [[nodiscard]] const CallbackSet& callbacks() const { return plan_.callbacks; }
    [[nodiscard]] const InitializationResult& initialization() const { return initialization_; }

    [[nodiscard]] bool has_solution() const { return solution_.has_value(); }
    [[nodiscard]] const DaeSolution& solution() const;  // throws std::logic_error before run()
    [[nodiscard]] const std::optional<SmallSignalResult>& last_small_signal() const {
        return small_signal_;
    }

    /// Trajectory of one device state; throws std::out_of_range for unknown names
    [[nodiscard]] TimeSeries state_series(const std::string& device, const std::string& state) const;

    /// Voltage magnitude trajectory of a bus; throws BuildError for unknown buses
    [[nodiscard]] TimeSeries voltage_series(int bus_number) const;

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return log_.entries(); }

private:
    Simulation(std::shared_ptr<PowerSystem> system,
               const std::vector<Perturbation>& perturbations,
               SimulationOptions options);

    SimulationOptions options_;
    std::unique_ptr<SimulationInputs> inputs_;
    std::unique_ptr<ResidualEvaluator<Real>> residual_;
    std::unique_ptr<JacobianEvaluator> jacobian_;
    DaeProblem problem_;
    PerturbationPlan plan_;

    Vector x0_init_;
    InitializationResult initialization_;
    bool initialized_ = false;
    bool reset_ = false;
    SimulationStage stage_ = SimulationStage::Built;

    std::optional<DaeSolution> solution_;
    std::optional<SmallSignalResult> small_signal_;
    DiagnosticLog log_;
};

/// The simulation folder must be an existing directory; throws BuildError
void check_folder(const std::filesystem::path& folder);

}  // namespace powerdyn::v1
