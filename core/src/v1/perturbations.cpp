#include "powerdyn/v1/perturbations.hpp"

#include <algorithm>
#include <sstream>

namespace powerdyn::v1 {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// Mutable parameters of a static or dynamic line, resolved by name
struct BranchRef {
    bool dynamic = false;
    std::size_t ix = 0;
};

BranchRef resolve_branch(const PowerSystem& system, const std::string& name) {
    for (std::size_t i = 0; i < system.lines.size(); ++i) {
        if (system.lines[i].name == name) return {false, i};
    }
    for (std::size_t i = 0; i < system.dynamic_lines.size(); ++i) {
        if (system.dynamic_lines[i].name == name) return {true, i};
    }
    throw BuildError("perturbation references unknown branch '" + name + "'");
}

template<typename Items>
std::size_t resolve_named(const Items& items, const std::string& name, const char* what) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i].name == name) return i;
    }
    throw BuildError(std::string("perturbation references unknown ") + what + " '" + name + "'");
}

std::size_t resolve_injection(const SimulationInputs& inputs, const std::string& name) {
    const auto& injections = inputs.injections();
    for (std::size_t i = 0; i < injections.size(); ++i) {
        if (injections[i].device.name == name) return i;
    }
    throw BuildError("perturbation references unknown dynamic injection '" + name + "'");
}

PerturbationEffect make_effect(SimulationInputs& inputs, const Perturbation& perturbation) {
    const PowerSystem& system = inputs.system();
    return std::visit(overloaded{
        [&](const ControlReferenceChange& p) -> PerturbationEffect {
            const std::size_t ix = resolve_injection(inputs, p.device);
            return [ix, signal = p.signal, value = p.value](SimulationInputs& in) {
                in.injections()[ix].device.refs.set(signal, value);
            };
        },
        [&](const BranchTrip& p) -> PerturbationEffect {
            const BranchRef ref = resolve_branch(system, p.branch);
            return [ref](SimulationInputs& in) {
                if (ref.dynamic) {
                    in.system().dynamic_lines[ref.ix].available = false;
                } else {
                    in.system().lines[ref.ix].available = false;
                }
                in.network().rebuild(in.system());
            };
        },
        [&](const BranchImpedanceChange& p) -> PerturbationEffect {
            if (p.multiplier <= 0.0) {
                throw BuildError("impedance multiplier for branch '" + p.branch + "' must be positive");
            }
            const BranchRef ref = resolve_branch(system, p.branch);
            const Real r0 = ref.dynamic ? system.dynamic_lines[ref.ix].r : system.lines[ref.ix].r;
            const Real x0 = ref.dynamic ? system.dynamic_lines[ref.ix].x : system.lines[ref.ix].x;
            return [ref, r0, x0, m = p.multiplier](SimulationInputs& in) {
                if (ref.dynamic) {
                    auto& line = in.system().dynamic_lines[ref.ix];
                    line.r = r0 * m;
                    line.x = x0 * m;
                } else {
                    auto& line = in.system().lines[ref.ix];
                    line.r = r0 * m;
                    line.x = x0 * m;
                }
                in.network().rebuild(in.system());
            };
        },
        [&](const NetworkSwitch& p) -> PerturbationEffect {
            const Index n = inputs.bus_count();
            if (p.ybus.rows() != n || p.ybus.cols() != n) {
                throw BuildError("network switch matrix must be " + std::to_string(n) + "x" +
                                 std::to_string(n));
            }
            return [ybus = p.ybus](SimulationInputs& in) { in.network().set_ybus(ybus); };
        },
        [&](const LoadChange& p) -> PerturbationEffect {
            const std::size_t ix = resolve_named(system.loads, p.load, "load");
            return [ix, variable = p.variable, value = p.value](SimulationInputs& in) {
                auto& load = in.system().loads[ix];
                if (variable == LoadVariable::P) {
                    load.P = value;
                } else {
                    load.Q = value;
                }
            };
        },
        [&](const LoadTrip& p) -> PerturbationEffect {
            const std::size_t ix = resolve_named(system.loads, p.load, "load");
            return [ix](SimulationInputs& in) { in.system().loads[ix].available = false; };
        },
        [&](const SourceBusVoltageChange& p) -> PerturbationEffect {
            const std::size_t ix = resolve_named(system.sources, p.source, "source");
            return [ix, variable = p.variable, value = p.value](SimulationInputs& in) {
                auto& source = in.system().sources[ix];
                if (variable == SourceVariable::Magnitude) {
                    source.V_ref = value;
                } else {
                    source.theta_ref = value;
                }
            };
        },
        [&](const GeneratorTrip& p) -> PerturbationEffect {
            const std::size_t ix = resolve_injection(inputs, p.device);
            return [ix](SimulationInputs& in) {
                const InjectionIndex& entry = in.injections()[ix];
                if (entry.device.category == DeviceCategory::Generator) {
                    in.system().generators[entry.model_ix].available = false;
                } else {
                    in.system().inverters[entry.model_ix].available = false;
                }
            };
        },
    }, perturbation);
}

}  // namespace

Real trigger_time(const Perturbation& perturbation) {
    return std::visit([](const auto& p) { return p.time; }, perturbation);
}

std::string describe(const Perturbation& perturbation) {
    std::ostringstream out;
    std::visit(overloaded{
        [&](const ControlReferenceChange& p) {
            out << "ControlReferenceChange " << p.device << ' ' << to_string(p.signal)
                << " -> " << p.value;
        },
        [&](const BranchTrip& p) { out << "BranchTrip " << p.branch; },
        [&](const BranchImpedanceChange& p) {
            out << "BranchImpedanceChange " << p.branch << " x" << p.multiplier;
        },
        [&](const NetworkSwitch& p) {
            out << "NetworkSwitch " << p.ybus.rows() << 'x' << p.ybus.cols();
        },
        [&](const LoadChange& p) {
            out << "LoadChange " << p.load << ' ' << (p.variable == LoadVariable::P ? "P" : "Q")
                << " -> " << p.value;
        },
        [&](const LoadTrip& p) { out << "LoadTrip " << p.load; },
        [&](const SourceBusVoltageChange& p) {
            out << "SourceBusVoltageChange " << p.source << ' '
                << (p.variable == SourceVariable::Magnitude ? "V_ref" : "theta_ref")
                << " -> " << p.value;
        },
        [&](const GeneratorTrip& p) { out << "GeneratorTrip " << p.device; },
    }, perturbation);
    out << " at t=" << trigger_time(perturbation);
    return out.str();
}

PerturbationPlan build_perturbations(SimulationInputs& inputs,
                                     const std::vector<Perturbation>& perturbations) {
    PerturbationPlan plan;
    if (perturbations.empty()) {
        plan.tstops = {0.0};
        return plan;
    }

    plan.tstops.reserve(perturbations.size());
    for (const auto& p : perturbations) {
        const Real time = trigger_time(p);
        plan.callbacks.add(DiscreteCallback(time, make_effect(inputs, p), describe(p)));
        plan.tstops.push_back(time);
    }
    std::sort(plan.tstops.begin(), plan.tstops.end());
    plan.tstops.erase(std::unique(plan.tstops.begin(), plan.tstops.end()), plan.tstops.end());
    return plan;
}

}  // namespace powerdyn::v1
