#include "powerdyn/v1/simulation_inputs.hpp"

#include <cmath>
#include <stdexcept>

namespace powerdyn::v1 {

namespace {

template<typename Device>
InjectionIndex index_injection(const Device& device, DeviceCategory category, std::size_t model_ix,
                               const Network& network, const SystemConstants& constants) {
    if (device.base_power <= 0.0) {
        throw BuildError("device '" + device.name + "' has a non-positive base power");
    }
    const auto bus = network.find_bus(device.bus);
    if (!bus) {
        throw BuildError("device '" + device.name + "' references unknown bus " +
                         std::to_string(device.bus));
    }
    InjectionIndex entry;
    entry.device = DeviceIndexBuilder::build(device.name, category, device.states(),
                                             device.components(), device.refs);
    entry.model_ix = model_ix;
    entry.bus = *bus;
    entry.base_power_ratio = device.base_power / constants.base_power;
    return entry;
}

}  // namespace

SimulationInputs::SimulationInputs(std::shared_ptr<PowerSystem> system)
    : system_(std::move(system)) {
    if (!system_) {
        throw BuildError("no power system supplied");
    }
    if (system_->buses.empty()) {
        throw BuildError("power system has no buses");
    }
    for (const auto& load : system_->loads) {
        const Bus* bus = system_->find_bus(load.bus);
        if (bus == nullptr) {
            throw BuildError("load '" + load.name + "' references unknown bus " +
                             std::to_string(load.bus));
        }
        if (bus->magnitude <= 0.0) {
            throw BuildError("load '" + load.name + "' sits on a bus without a voltage magnitude");
        }
    }
    for (const auto& source : system_->sources) {
        if (system_->find_bus(source.bus) == nullptr) {
            throw BuildError("source '" + source.name + "' references unknown bus " +
                             std::to_string(source.bus));
        }
        if (source.R_th == 0.0 && source.X_th == 0.0) {
            throw BuildError("source '" + source.name + "' needs a non-zero Thevenin impedance");
        }
    }

    network_ = Network::build(*system_);
    const Index n = network_.bus_count();

    for (std::size_t i = 0; i < system_->loads.size(); ++i) {
        const PowerLoad& load = system_->loads[i];
        const Real v0 = system_->find_bus(load.bus)->magnitude;
        loads_.push_back(LoadIndex{i, network_.bus_index(load.bus), 1.0 / (v0 * v0)});
    }
    for (std::size_t i = 0; i < system_->sources.size(); ++i) {
        sources_.push_back(SourceIndex{i, network_.bus_index(system_->sources[i].bus)});
    }
    Index offset = 2 * n;

    for (std::size_t i = 0; i < system_->generators.size(); ++i) {
        auto entry = index_injection(system_->generators[i], DeviceCategory::Generator, i,
                                     network_, system_->constants);
        entry.device.offset = offset;
        registry_.add(entry.device.name, offset, entry.device.states);
        offset += entry.device.size();
        injections_.push_back(std::move(entry));
    }
    for (std::size_t i = 0; i < system_->inverters.size(); ++i) {
        auto entry = index_injection(system_->inverters[i], DeviceCategory::Inverter, i,
                                     network_, system_->constants);
        entry.device.offset = offset;
        registry_.add(entry.device.name, offset, entry.device.states);
        offset += entry.device.size();
        injections_.push_back(std::move(entry));
    }
    injection_state_count_ = offset - 2 * n;

    for (std::size_t i = 0; i < system_->dynamic_lines.size(); ++i) {
        const auto& line = system_->dynamic_lines[i];
        if (line.x <= 0.0) {
            throw BuildError("dynamic line '" + line.name + "' needs a positive reactance");
        }
        BranchIndex entry;
        entry.name = line.name;
        entry.model_ix = i;
        entry.from = network_.bus_index(line.from);
        entry.to = network_.bus_index(line.to);
        entry.offset = offset;
        registry_.add(line.name, offset, DynamicLine::states());
        offset += 2;
        branches_.push_back(std::move(entry));
    }
    branch_state_count_ = offset - 2 * n - injection_state_count_;
    variable_count_ = offset;

    differential_vars_.assign(static_cast<std::size_t>(variable_count_), true);
    for (Index i = 0; i < 2 * n; ++i) {
        differential_vars_[static_cast<std::size_t>(i)] = false;
    }
    for (const Index b : network_.voltage_buses()) {
        differential_vars_[static_cast<std::size_t>(b)] = true;
        differential_vars_[static_cast<std::size_t>(b + n)] = true;
    }
}

InjectionIndex* SimulationInputs::find_injection(const std::string& name) {
    for (auto& entry : injections_) {
        if (entry.device.name == name) return &entry;
    }
    return nullptr;
}

std::pair<Index, Index> SimulationInputs::voltage_index(int bus_number) const {
    const Index b = network_.bus_index(bus_number);
    return {b, b + network_.bus_count()};
}

Vector SimulationInputs::flat_start() const {
    Vector x0 = Vector::Zero(variable_count_);
    x0.head(network_.bus_count()).setConstant(1.0);
    for (const auto& entry : injections_) {
        const std::vector<Real> guess = entry.device.category == DeviceCategory::Generator
            ? system_->generators[entry.model_ix].initial_guess()
            : system_->inverters[entry.model_ix].initial_guess();
        for (std::size_t k = 0; k < guess.size(); ++k) {
            x0[entry.device.offset + static_cast<Index>(k)] = guess[k];
        }
    }
    return x0;
}

bool SimulationInputs::has_source() const {
    return !system_->sources.empty();
}

void SimulationInputs::store_initial_conditions(const Vector& x) {
    const Index n = bus_count();
    if (x.size() != variable_count_) {
        throw std::invalid_argument("operating point has " + std::to_string(x.size()) +
                                    " entries, expected " + std::to_string(variable_count_));
    }
    for (Index b = 0; b < n; ++b) {
        Bus& bus = system_->buses[static_cast<std::size_t>(b)];
        bus.magnitude = std::hypot(x[b], x[b + n]);
        bus.angle = std::atan2(x[b + n], x[b]);
    }
    for (const auto& entry : injections_) {
        auto& conditions = entry.device.category == DeviceCategory::Generator
            ? system_->generators[entry.model_ix].initial_conditions
            : system_->inverters[entry.model_ix].initial_conditions;
        conditions.clear();
        for (std::size_t k = 0; k < entry.device.states.size(); ++k) {
            conditions[entry.device.states[k]] = x[entry.device.offset + static_cast<Index>(k)];
        }
    }
    for (const auto& entry : branches_) {
        auto& conditions = system_->dynamic_lines[entry.model_ix].initial_conditions;
        conditions["Il_R"] = x[entry.offset];
        conditions["Il_I"] = x[entry.offset + 1];
    }
}

}  // namespace powerdyn::v1
