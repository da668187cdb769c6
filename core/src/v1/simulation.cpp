#include "powerdyn/v1/simulation.hpp"

#include "powerdyn/v1/io/json_export.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace powerdyn::v1 {

void check_folder(const std::filesystem::path& folder) {
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        throw BuildError("simulation folder '" + folder.string() + "' does not exist");
    }
    const auto perms = std::filesystem::status(folder, ec).permissions();
    if (ec || (perms & std::filesystem::perms::owner_write) == std::filesystem::perms::none) {
        throw BuildError("simulation folder '" + folder.string() + "' is not writable");
    }
}

// =============================================================================
// Build
// =============================================================================

Simulation Simulation::build(const PowerSystem& system,
                             const std::vector<Perturbation>& perturbations,
                             SimulationOptions options) {
    check_folder(options.simulation_folder);
    if (options.system_to_file) {
        io::write_system_json(system, options.simulation_folder / "input_system.json");
    }
    return Simulation(std::make_shared<PowerSystem>(system), perturbations, std::move(options));
}

Simulation Simulation::build_in_place(std::shared_ptr<PowerSystem> system,
                                      const std::vector<Perturbation>& perturbations,
                                      SimulationOptions options) {
    check_folder(options.simulation_folder);
    const bool to_file = options.system_to_file;
    const auto folder = options.simulation_folder;
    Simulation sim(std::move(system), perturbations, std::move(options));
    if (to_file) {
        const auto path = folder / "initialized_system.json";
        io::write_system_json(sim.inputs().system(), path);
        sim.log_.emit(DiagnosticSeverity::Advisory, DiagnosticCode::SnapshotWritten, path.string());
    }
    return sim;
}

Simulation::Simulation(std::shared_ptr<PowerSystem> system,
                       const std::vector<Perturbation>& perturbations,
                       SimulationOptions options)
    : options_(std::move(options)),
      log_(options_.diagnostic_callback) {
    const auto [t0, tf] = options_.tspan;
    if (!(tf > t0)) {
        throw BuildError("tspan must be increasing");
    }

    inputs_ = std::make_unique<SimulationInputs>(std::move(system));
    const Index n = inputs_->variable_count();

    if (options_.initial_guess) {
        if (options_.initial_guess->size() != n) {
            std::ostringstream oss;
            oss << "initial guess has " << options_.initial_guess->size()
                << " entries, the system has " << n << " variables";
            throw BuildError(oss.str());
        }
        x0_init_ = *options_.initial_guess;
    } else {
        x0_init_ = inputs_->flat_start();
    }

    plan_ = build_perturbations(*inputs_, perturbations);

    residual_ = std::make_unique<ResidualEvaluator<Real>>(*inputs_);
    jacobian_ = std::make_unique<JacobianEvaluator>(*inputs_);

    ResidualEvaluator<Real>* residual = residual_.get();
    JacobianEvaluator* jacobian = jacobian_.get();
    problem_.residual = [residual](Vector& out, const Vector& dx, const Vector& x, Real t) {
        out.resize(x.size());
        const auto size = static_cast<std::size_t>(x.size());
        residual->evaluate(std::span<Real>(out.data(), size),
                           std::span<const Real>(dx.data(), size),
                           std::span<const Real>(x.data(), size), t);
    };
    problem_.jacobian = [jacobian](const Vector& x, const Vector& dx, Real t,
                                   SparseMatrix& J, Vector& f) {
        jacobian->evaluate_sparse(x, dx, t, J, f);
    };
    problem_.tspan = options_.tspan;
    problem_.differential_vars = inputs_->differential_vars();
    problem_.x0 = x0_init_;
    problem_.dx0 = Vector::Zero(n);

    if (options_.initialize) {
        initialize();
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

bool Simulation::initialize() {
    InitializationOptions init_options = options_.initialization;
    init_options.time = options_.tspan.first;
    initialization_ = initialize_state(*inputs_, x0_init_, init_options);

    initialized_ = initialization_.success;
    if (initialized_) {
        x0_init_ = initialization_.state;
        inputs_->store_initial_conditions(x0_init_);
        if (stage_ == SimulationStage::Built) {
            stage_ = SimulationStage::Initialized;
        }
    } else {
        log_.emit(DiagnosticSeverity::Warning, DiagnosticCode::InitializationFailed,
                  "initialization failed, continuing with the supplied guess: " +
                      initialization_.message);
    }
    problem_.x0 = x0_init_;
    return initialized_;
}

SimulationRunResult Simulation::run() {
    SimulationRunResult result;
    if (reset_) {
        result.status = SimulationStatus::ResetRequired;
        result.solver_status = SolverStatus::NumericalError;
        result.message = "Reset the simulation";
        log_.emit(DiagnosticSeverity::Error, DiagnosticCode::ResetRequired,
                  "run refused: " + result.message);
        return result;
    }

    // Derivative consistent with the starting state on the differential rows
    const Index n = inputs_->variable_count();
    Vector f(n);
    problem_.residual(f, Vector::Zero(n), problem_.x0, problem_.tspan.first);
    problem_.dx0 = Vector::Zero(n);
    for (Index i = 0; i < n; ++i) {
        if (problem_.differential_vars[static_cast<std::size_t>(i)]) {
            problem_.dx0[i] = f[i];
        }
    }

    plan_.callbacks.arm_all();
    auto on_stop = [this, &result](Real t, const Vector&) {
        const std::vector<std::string> fired = plan_.callbacks.apply(t, *inputs_);
        for (const auto& description : fired) {
            log_.emit(DiagnosticSeverity::Advisory, DiagnosticCode::PerturbationApplied, description);
            result.perturbations_applied.push_back(description);
        }
        return !fired.empty();
    };

    auto solver = make_dae_solver(options_.backend, options_.solver);
    DaeSolution solution = solver->solve(problem_, plan_.tstops, on_stop);

    if (plan_.callbacks.any_fired()) {
        reset_ = true;
    }

    result.solver_status = solution.status;
    result.statistics = solution.statistics;
    if (solution.success) {
        result.status = SimulationStatus::Success;
        std::ostringstream oss;
        oss << "integrated to t=" << (solution.time.empty() ? problem_.tspan.first : solution.time.back())
            << " in " << solution.statistics.steps << " steps";
        result.message = oss.str();
    } else {
        result.status = SimulationStatus::SolverFailure;
        result.message = solution.message.empty() ? std::string(to_string(solution.status))
                                                  : solution.message;
        if (!solution.failure_reason.empty()) {
            result.message += " [" + solution.failure_reason + "]";
        }
        log_.emit(DiagnosticSeverity::Error, DiagnosticCode::SolverFailure, result.message);
    }

    solution_ = std::move(solution);
    stage_ = SimulationStage::Integrated;
    return result;
}

SmallSignalResult Simulation::small_signal_analysis() {
    return small_signal_analysis(x0_init_);
}

SmallSignalResult Simulation::small_signal_analysis(const Vector& operating_point) {
    if (reset_) {
        SmallSignalResult refused;
        refused.status = SmallSignalStatus::SimulationReset;
        refused.message = "Reset the simulation";
        refused.operating_point = operating_point;
        refused.diagnostics.push_back(log_.emit(DiagnosticSeverity::Error,
                                                DiagnosticCode::ResetRequired,
                                                "small-signal analysis refused: " + refused.message));
        return refused;
    }
    SmallSignalResult result =
        analyze_small_signal(*inputs_, operating_point, 0.0, log_, options_.small_signal);
    small_signal_ = result;
    return result;
}

// =============================================================================
// Results
// =============================================================================

const DaeSolution& Simulation::solution() const {
    if (!solution_) {
        throw std::logic_error("simulation has not been run");
    }
    return *solution_;
}

TimeSeries Simulation::state_series(const std::string& device, const std::string& state) const {
    const Index ix = inputs_->registry().at(device, state);
    TimeSeries series;
    if (!solution_) return series;
    series.time = solution_->time;
    series.values.reserve(solution_->states.size());
    for (const auto& x : solution_->states) {
        series.values.push_back(x[ix]);
    }
    return series;
}

TimeSeries Simulation::voltage_series(int bus_number) const {
    const auto [ix_r, ix_i] = inputs_->voltage_index(bus_number);
    TimeSeries series;
    if (!solution_) return series;
    series.time = solution_->time;
    series.values.reserve(solution_->states.size());
    for (const auto& x : solution_->states) {
        series.values.push_back(std::hypot(x[ix_r], x[ix_i]));
    }
    return series;
}

}  // namespace powerdyn::v1
