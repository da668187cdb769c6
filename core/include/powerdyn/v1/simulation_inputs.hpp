#pragma once

// =============================================================================
// powerdyn - Simulation Inputs
// =============================================================================
// Everything the residual evaluator reads: the (mutable) power system, the
// network matrices, per-device indices and the global state layout
//
//   [ V_r(0..n-1) | V_i(0..n-1) | injection states | dynamic branch states ]
//
// Built once; perturbation effects mutate parameters, availability and the
// admittance matrix, never the layout.
// =============================================================================

#include "powerdyn/v1/device_index.hpp"
#include "powerdyn/v1/network.hpp"
#include "powerdyn/v1/system.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace powerdyn::v1 {

/// Dynamic injection resolved against the network
struct InjectionIndex {
    DeviceIndex device;
    std::size_t model_ix = 0;  // position in PowerSystem::generators or ::inverters
    Index bus = 0;             // network row
    Real base_power_ratio = 1.0;
};

/// Constant-impedance load resolved against the network
struct LoadIndex {
    std::size_t model_ix = 0;  // position in PowerSystem::loads
    Index bus = 0;
    Real inv_v0_sq = 1.0;      // 1 / |V0|^2 at the build-time bus magnitude
};

/// Voltage source resolved against the network
struct SourceIndex {
    std::size_t model_ix = 0;  // position in PowerSystem::sources
    Index bus = 0;
};

/// Dynamic branch resolved against the network
struct BranchIndex {
    std::string name;
    std::size_t model_ix = 0;  // position in PowerSystem::dynamic_lines
    Index from = 0;
    Index to = 0;
    Index offset = 0;          // global index of Il_R
};

class SimulationInputs {
public:
    /// Throws IndexingError or BuildError; never returns a partial object
    explicit SimulationInputs(std::shared_ptr<PowerSystem> system);

    [[nodiscard]] PowerSystem& system() { return *system_; }
    [[nodiscard]] const PowerSystem& system() const { return *system_; }
    [[nodiscard]] const std::shared_ptr<PowerSystem>& system_ptr() const { return system_; }

    [[nodiscard]] Network& network() { return network_; }
    [[nodiscard]] const Network& network() const { return network_; }

    [[nodiscard]] std::vector<InjectionIndex>& injections() { return injections_; }
    [[nodiscard]] const std::vector<InjectionIndex>& injections() const { return injections_; }
    [[nodiscard]] const std::vector<BranchIndex>& branches() const { return branches_; }
    [[nodiscard]] const std::vector<LoadIndex>& loads() const { return loads_; }
    [[nodiscard]] const std::vector<SourceIndex>& sources() const { return sources_; }
    [[nodiscard]] const StateRegistry& registry() const { return registry_; }

    [[nodiscard]] InjectionIndex* find_injection(const std::string& name);

    [[nodiscard]] Index bus_count() const { return network_.bus_count(); }
    [[nodiscard]] Index variable_count() const { return variable_count_; }
    [[nodiscard]] Index injection_state_count() const { return injection_state_count_; }
    [[nodiscard]] Index branch_state_count() const { return branch_state_count_; }

    /// Per-state differential flag (bus voltages are algebraic unless voltage buses)
    [[nodiscard]] const std::vector<bool>& differential_vars() const { return differential_vars_; }

    /// Global (real, imaginary) voltage indices of a bus; throws BuildError if unknown
    [[nodiscard]] std::pair<Index, Index> voltage_index(int bus_number) const;

    /// Flat start: V_r = 1 at every bus plus each sub-model's nominal state values
    [[nodiscard]] Vector flat_start() const;

    [[nodiscard]] bool has_source() const;

    /// Write an operating point back into the power system: bus magnitude and
    /// angle, and the local states of every dynamic injection and dynamic line
    void store_initial_conditions(const Vector& x);

private:
    std::shared_ptr<PowerSystem> system_;
    Network network_;
    std::vector<InjectionIndex> injections_;
    std::vector<BranchIndex> branches_;
    std::vector<LoadIndex> loads_;
    std::vector<SourceIndex> sources_;
    StateRegistry registry_;
    std::vector<bool> differential_vars_;
    Index variable_count_ = 0;
    Index injection_state_count_ = 0;
    Index branch_state_count_ = 0;
};

}  // namespace powerdyn::v1
