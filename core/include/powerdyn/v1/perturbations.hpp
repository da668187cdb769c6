#pragma once

// =============================================================================
// powerdyn - Perturbations and Discrete Callbacks
// =============================================================================
// A perturbation is a trigger time plus an effect on the simulation inputs.
// build_perturbations() validates every target, then materializes one
// DiscreteCallback per perturbation together with the sorted list of
// mandatory stop times for the integrator.
// =============================================================================

#include "powerdyn/v1/simulation_inputs.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace powerdyn::v1 {

// =============================================================================
// Perturbation Catalogue
// =============================================================================

/// Set one control reference of a dynamic injection
struct ControlReferenceChange {
    Real time = 0.0;
    std::string device;
    ControlReference signal = ControlReference::ActivePowerRef;
    Real value = 0.0;
};

/// Take a line or dynamic line out of service
struct BranchTrip {
    Real time = 0.0;
    std::string branch;
};

/// Scale the series r and x of a branch relative to their built values
struct BranchImpedanceChange {
    Real time = 0.0;
    std::string branch;
    Real multiplier = 1.0;
};

/// Replace the admittance matrix
struct NetworkSwitch {
    Real time = 0.0;
    ComplexSparseMatrix ybus;
};

enum class LoadVariable : std::uint8_t { P, Q };

struct LoadChange {
    Real time = 0.0;
    std::string load;
    LoadVariable variable = LoadVariable::P;
    Real value = 0.0;
};

struct LoadTrip {
    Real time = 0.0;
    std::string load;
};

enum class SourceVariable : std::uint8_t { Magnitude, Angle };

struct SourceBusVoltageChange {
    Real time = 0.0;
    std::string source;
    SourceVariable variable = SourceVariable::Magnitude;
    Real value = 1.0;
};

/// Disconnect a dynamic injection (generator or inverter)
struct GeneratorTrip {
    Real time = 0.0;
    std::string device;
};

using Perturbation = std::variant<ControlReferenceChange,
                                  BranchTrip,
                                  BranchImpedanceChange,
                                  NetworkSwitch,
                                  LoadChange,
                                  LoadTrip,
                                  SourceBusVoltageChange,
                                  GeneratorTrip>;

[[nodiscard]] Real trigger_time(const Perturbation& perturbation);
[[nodiscard]] std::string describe(const Perturbation& perturbation);

// =============================================================================
// Discrete Callbacks
// =============================================================================

enum class CallbackState : std::uint8_t {
    Scheduled,
    Armed,
    Fired
};

[[nodiscard]] constexpr const char* to_string(CallbackState state) noexcept {
    switch (state) {
        case CallbackState::Scheduled: return "scheduled";
        case CallbackState::Armed: return "armed";
        case CallbackState::Fired: return "fired";
    }
    return "unknown";
}

using PerturbationEffect = std::function<void(SimulationInputs&)>;

class DiscreteCallback {
public:
    DiscreteCallback(Real time, PerturbationEffect effect, std::string description)
        : time_(time), effect_(std::move(effect)), description_(std::move(description)) {}

    /// Literal comparison against the trigger time
    [[nodiscard]] bool condition(Real t) const { return t == time_; }

    /// Register the stop time with an integrator
    void arm() {
        if (state_ == CallbackState::Scheduled) state_ = CallbackState::Armed;
    }

    /// Apply the effect; returns false when it already fired
    bool fire(SimulationInputs& inputs) {
        if (state_ == CallbackState::Fired) return false;
        effect_(inputs);
        state_ = CallbackState::Fired;
        return true;
    }

    [[nodiscard]] Real time() const { return time_; }
    [[nodiscard]] CallbackState state() const { return state_; }
    [[nodiscard]] const std::string& description() const { return description_; }

private:
    Real time_;
    PerturbationEffect effect_;
    std::string description_;
    CallbackState state_ = CallbackState::Scheduled;
};

class CallbackSet {
public:
    void add(DiscreteCallback callback) { callbacks_.push_back(std::move(callback)); }

    [[nodiscard]] bool empty() const { return callbacks_.empty(); }
    [[nodiscard]] std::size_t size() const { return callbacks_.size(); }
    [[nodiscard]] const DiscreteCallback& operator[](std::size_t i) const { return callbacks_[i]; }
    [[nodiscard]] auto begin() const { return callbacks_.begin(); }
    [[nodiscard]] auto end() const { return callbacks_.end(); }

    void arm_all() {
        for (auto& cb : callbacks_) cb.arm();
    }

    /// Fire every callback whose condition holds at `t`; returns the descriptions fired
    std::vector<std::string> apply(Real t, SimulationInputs& inputs) {
        std::vector<std::string> fired;
        for (auto& cb : callbacks_) {
            if (cb.condition(t) && cb.fire(inputs)) {
                fired.push_back(cb.description());
            }
        }
        return fired;
    }

    [[nodiscard]] bool any_fired() const {
        for (const auto& cb : callbacks_) {
            if (cb.state() == CallbackState::Fired) return true;
        }
        return false;
    }

private:
    std::vector<DiscreteCallback> callbacks_;
};

struct PerturbationPlan {
    CallbackSet callbacks;
    std::vector<Real> tstops;
};

/// Validate and materialize perturbations. An empty list yields an empty
/// callback set and the single stop time 0.0. Throws BuildError for targets
/// that do not exist in the inputs.
[[nodiscard]] PerturbationPlan build_perturbations(SimulationInputs& inputs,
                                                   const std::vector<Perturbation>& perturbations);

}  // namespace powerdyn::v1
