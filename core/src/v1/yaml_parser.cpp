#include "powerdyn/v1/parser/yaml_parser.hpp"

#include "powerdyn/v1/components/catalogue.hpp"
#include "powerdyn/v1/network.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace powerdyn::v1::parser {

namespace {

constexpr const char* kSchemaId = "powerdyn-v1";
constexpr const char* kDiagUnknownField = "POWERDYN_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "POWERDYN_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagMissingField = "POWERDYN_YAML_E_MISSING_FIELD";
constexpr const char* kDiagUnsupportedComponent = "POWERDYN_YAML_E_COMPONENT_UNSUPPORTED";
constexpr const char* kDiagUnsupportedPerturbation = "POWERDYN_YAML_E_PERTURBATION_UNSUPPORTED";
constexpr const char* kDiagInvalidParameter = "POWERDYN_YAML_E_PARAM_INVALID";
constexpr const char* kDiagDefaultComponent = "POWERDYN_YAML_W_COMPONENT_DEFAULT";
constexpr const char* kDiagIgnoredField = "POWERDYN_YAML_W_FIELD_IGNORED";

using Messages = std::vector<std::string>;

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(Messages& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(Messages& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(Messages& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(
        errors,
        kDiagTypeMismatch,
        "Type mismatch at '" + path + "' (expected " + expected +
            ", got " + yaml_node_class(received) + ")");
}

/// Scalar conversion with a type-mismatch error instead of an exception
template<typename T>
std::optional<T> parse_scalar(const YAML::Node& node,
                              const std::string& path,
                              const std::string& expected,
                              Messages& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
}

std::optional<Real> parse_real(const YAML::Node& node, const std::string& path, Messages& errors) {
    return parse_scalar<Real>(node, path, "number", errors);
}

std::optional<int> parse_int(const YAML::Node& node, const std::string& path, Messages& errors) {
    return parse_scalar<int>(node, path, "integer", errors);
}

std::optional<bool> parse_bool(const YAML::Node& node, const std::string& path, Messages& errors) {
    return parse_scalar<bool>(node, path, "boolean", errors);
}

std::optional<std::string> parse_string(const YAML::Node& node, const std::string& path,
                                        Messages& errors) {
    return parse_scalar<std::string>(node, path, "string", errors);
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   Messages& errors,
                   Messages& warnings,
                   bool strict) {
    if (!node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) != allowed.end()) continue;
        if (strict) {
            push_error(errors, kDiagUnknownField, "Unknown field at '" + context + "." + key + "'");
        } else {
            push_warning(warnings, kDiagIgnoredField, "Ignoring field '" + context + "." + key + "'");
        }
    }
}

// Field readers that leave the target untouched when the key is absent
void read(const YAML::Node& node, const char* key, const std::string& path, Real& target,
          Messages& errors) {
    if (const auto v = parse_real(node[key], path + "." + key, errors)) target = *v;
}

void read(const YAML::Node& node, const char* key, const std::string& path, int& target,
          Messages& errors) {
    if (const auto v = parse_int(node[key], path + "." + key, errors)) target = *v;
}

void read(const YAML::Node& node, const char* key, const std::string& path, bool& target,
          Messages& errors) {
    if (const auto v = parse_bool(node[key], path + "." + key, errors)) target = *v;
}

void read(const YAML::Node& node, const char* key, const std::string& path, std::string& target,
          Messages& errors) {
    if (const auto v = parse_string(node[key], path + "." + key, errors)) target = *v;
}

bool require(const YAML::Node& node, std::initializer_list<const char*> keys,
             const std::string& path, Messages& errors) {
    bool ok = true;
    for (const char* key : keys) {
        if (!node[key]) {
            push_error(errors, kDiagMissingField, "Missing required field '" + path + "." + key + "'");
            ok = false;
        }
    }
    return ok;
}

/// Iterate a sequence of maps, reporting anything else
template<typename F>
void for_each_entry(const YAML::Node& node, const std::string& path, Messages& errors, F&& f) {
    if (!node) return;
    if (!node.IsSequence()) {
        push_type_mismatch_error(errors, path, "sequence", node);
        return;
    }
    std::size_t i = 0;
    for (const auto& entry : node) {
        const std::string entry_path = path + "[" + std::to_string(i++) + "]";
        if (!entry.IsMap()) {
            push_type_mismatch_error(errors, entry_path, "map", entry);
            continue;
        }
        f(entry, entry_path);
    }
}

template<typename Variant>
void parse_component(const YAML::Node& node,
                     const std::string& path,
                     Variant& target,
                     Messages& errors,
                     Messages& warnings,
                     bool strict) {
    if (!node) {
        push_warning(warnings, kDiagDefaultComponent,
                     "No '" + path + "' given, using " + component_type_name(target));
        return;
    }
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, path, "map", node);
        return;
    }
    const auto type = parse_string(node["type"], path + ".type", errors);
    if (!type) {
        push_error(errors, kDiagMissingField, "Missing required field '" + path + ".type'");
        return;
    }
    auto model = make_component<Variant>(*type);
    if (!model) {
        push_error(errors, kDiagUnsupportedComponent,
                   "Unsupported component type '" + *type + "' at '" + path + "'");
        return;
    }

    std::visit([&](auto& m) {
        for (const auto& it : node) {
            const std::string key = it.first.as<std::string>();
            if (key == "type") continue;
            Real* parameter = find_parameter(m, key);
            if (parameter == nullptr) {
                if (strict) {
                    push_error(errors, kDiagUnknownField,
                               "Unknown parameter '" + key + "' for " + *type + " at '" + path + "'");
                } else {
                    push_warning(warnings, kDiagIgnoredField,
                                 "Ignoring parameter '" + key + "' for " + *type);
                }
                continue;
            }
            if (const auto v = parse_real(it.second, path + "." + key, errors)) {
                *parameter = *v;
            }
        }
    }, *model);

    target = std::move(*model);
}

std::optional<BusType> parse_bus_type(const std::string& raw) {
    if (raw == "REF" || raw == "ref" || raw == "SLACK" || raw == "slack") return BusType::REF;
    if (raw == "PV" || raw == "pv") return BusType::PV;
    if (raw == "PQ" || raw == "pq") return BusType::PQ;
    return std::nullopt;
}

std::optional<ControlReference> parse_control_reference(const std::string& raw) {
    if (raw == "V_ref") return ControlReference::VoltageRef;
    if (raw == "omega_ref") return ControlReference::FrequencyRef;
    if (raw == "P_ref") return ControlReference::ActivePowerRef;
    if (raw == "Q_ref") return ControlReference::ReactivePowerRef;
    return std::nullopt;
}

template<typename Branch>
Branch parse_branch(const YAML::Node& node, const std::string& path, Messages& errors,
                    Messages& warnings, bool strict) {
    validate_keys(node, {"name", "from", "to", "r", "x", "b", "available"}, path, errors,
                  warnings, strict);
    require(node, {"name", "from", "to"}, path, errors);
    Branch branch;
    read(node, "name", path, branch.name, errors);
    read(node, "from", path, branch.from, errors);
    read(node, "to", path, branch.to, errors);
    read(node, "r", path, branch.r, errors);
    read(node, "x", path, branch.x, errors);
    read(node, "b", path, branch.b, errors);
    read(node, "available", path, branch.available, errors);
    if (branch.r == 0.0 && branch.x == 0.0) {
        push_error(errors, kDiagInvalidParameter, "Branch at '" + path + "' has zero impedance");
    }
    return branch;
}

void read_refs(const YAML::Node& node, const std::string& path, ControlRefs& refs, Messages& errors) {
    read(node, "V_ref", path, refs.v_ref, errors);
    read(node, "omega_ref", path, refs.omega_ref, errors);
    read(node, "P_ref", path, refs.p_ref, errors);
    read(node, "Q_ref", path, refs.q_ref, errors);
}

void parse_system(const YAML::Node& node, PowerSystem& system, Messages& errors,
                  Messages& warnings, bool strict) {
    validate_keys(node,
                  {"base_power", "frequency", "buses", "lines", "dynamic_lines", "loads",
                   "sources", "generators", "inverters"},
                  "system", errors, warnings, strict);

    read(node, "base_power", "system", system.constants.base_power, errors);
    read(node, "frequency", "system", system.constants.frequency, errors);
    if (system.constants.base_power <= 0.0) {
        push_error(errors, kDiagInvalidParameter, "system.base_power must be positive");
    }
    if (system.constants.frequency <= 0.0) {
        push_error(errors, kDiagInvalidParameter, "system.frequency must be positive");
    }

    if (!node["buses"]) {
        push_error(errors, kDiagMissingField, "Missing required field 'system.buses'");
    }
    for_each_entry(node["buses"], "system.buses", errors, [&](const YAML::Node& n, const std::string& path) {
        validate_keys(n, {"number", "name", "base_voltage", "magnitude", "angle", "bus_type"},
                      path, errors, warnings, strict);
        require(n, {"number"}, path, errors);
        Bus bus;
        read(n, "number", path, bus.number, errors);
        bus.name = "bus" + std::to_string(bus.number);
        read(n, "name", path, bus.name, errors);
        read(n, "base_voltage", path, bus.base_voltage, errors);
        read(n, "magnitude", path, bus.magnitude, errors);
        read(n, "angle", path, bus.angle, errors);
        if (const auto raw = parse_string(n["bus_type"], path + ".bus_type", errors)) {
            if (const auto type = parse_bus_type(*raw)) {
                bus.bus_type = *type;
            } else {
                push_error(errors, kDiagInvalidParameter,
                           "Unknown bus type '" + *raw + "' at '" + path + "'");
            }
        }
        system.add_bus(std::move(bus));
    });

    for_each_entry(node["lines"], "system.lines", errors, [&](const YAML::Node& n, const std::string& path) {
        system.add_line(parse_branch<Line>(n, path, errors, warnings, strict));
    });
    for_each_entry(node["dynamic_lines"], "system.dynamic_lines", errors,
                   [&](const YAML::Node& n, const std::string& path) {
        system.add_dynamic_line(parse_branch<DynamicLine>(n, path, errors, warnings, strict));
    });

    for_each_entry(node["loads"], "system.loads", errors, [&](const YAML::Node& n, const std::string& path) {
        validate_keys(n, {"name", "bus", "P", "Q", "available"}, path, errors, warnings, strict);
        require(n, {"name", "bus"}, path, errors);
        PowerLoad load;
        read(n, "name", path, load.name, errors);
        read(n, "bus", path, load.bus, errors);
        read(n, "P", path, load.P, errors);
        read(n, "Q", path, load.Q, errors);
        read(n, "available", path, load.available, errors);
        system.add_load(std::move(load));
    });

    for_each_entry(node["sources"], "system.sources", errors, [&](const YAML::Node& n, const std::string& path) {
        validate_keys(n, {"name", "bus", "V_ref", "theta_ref", "R_th", "X_th", "available"},
                      path, errors, warnings, strict);
        require(n, {"name", "bus"}, path, errors);
        Source source;
        read(n, "name", path, source.name, errors);
        read(n, "bus", path, source.bus, errors);
        read(n, "V_ref", path, source.V_ref, errors);
        read(n, "theta_ref", path, source.theta_ref, errors);
        read(n, "R_th", path, source.R_th, errors);
        read(n, "X_th", path, source.X_th, errors);
        read(n, "available", path, source.available, errors);
        system.add_source(std::move(source));
    });

    for_each_entry(node["generators"], "system.generators", errors,
                   [&](const YAML::Node& n, const std::string& path) {
        validate_keys(n,
                      {"name", "bus", "base_power", "V_ref", "omega_ref", "P_ref", "Q_ref",
                       "available", "machine", "shaft", "avr", "tg", "pss"},
                      path, errors, warnings, strict);
        require(n, {"name", "bus"}, path, errors);
        DynamicGenerator gen;
        read(n, "name", path, gen.name, errors);
        read(n, "bus", path, gen.bus, errors);
        read(n, "base_power", path, gen.base_power, errors);
        read(n, "available", path, gen.available, errors);
        read_refs(n, path, gen.refs, errors);
        parse_component(n["machine"], path + ".machine", gen.machine, errors, warnings, strict);
        parse_component(n["shaft"], path + ".shaft", gen.shaft, errors, warnings, strict);
        parse_component(n["avr"], path + ".avr", gen.avr, errors, warnings, strict);
        parse_component(n["tg"], path + ".tg", gen.tg, errors, warnings, strict);
        parse_component(n["pss"], path + ".pss", gen.pss, errors, warnings, strict);
        system.add_generator(std::move(gen));
    });

    for_each_entry(node["inverters"], "system.inverters", errors,
                   [&](const YAML::Node& n, const std::string& path) {
        validate_keys(n,
                      {"name", "bus", "base_power", "V_ref", "omega_ref", "P_ref", "Q_ref",
                       "available", "converter", "outer_control", "inner_control", "dc_source",
                       "freq_estimator", "filter"},
                      path, errors, warnings, strict);
        require(n, {"name", "bus"}, path, errors);
        DynamicInverter inv;
        read(n, "name", path, inv.name, errors);
        read(n, "bus", path, inv.bus, errors);
        read(n, "base_power", path, inv.base_power, errors);
        read(n, "available", path, inv.available, errors);
        read_refs(n, path, inv.refs, errors);
        parse_component(n["converter"], path + ".converter", inv.converter, errors, warnings, strict);
        parse_component(n["outer_control"], path + ".outer_control", inv.outer_control, errors,
                        warnings, strict);
        parse_component(n["inner_control"], path + ".inner_control", inv.inner_control, errors,
                        warnings, strict);
        parse_component(n["dc_source"], path + ".dc_source", inv.dc_source, errors, warnings, strict);
        parse_component(n["freq_estimator"], path + ".freq_estimator", inv.freq_estimator, errors,
                        warnings, strict);
        parse_component(n["filter"], path + ".filter", inv.filter, errors, warnings, strict);
        system.add_inverter(std::move(inv));
    });
}

std::optional<Perturbation> parse_perturbation(const YAML::Node& n,
                                               const std::string& path,
                                               const PowerSystem& system,
                                               Messages& errors,
                                               Messages& warnings,
                                               bool strict) {
    if (!require(n, {"type", "time"}, path, errors)) {
        return std::nullopt;
    }
    const auto type = parse_string(n["type"], path + ".type", errors);
    const auto time = parse_real(n["time"], path + ".time", errors);
    if (!type || !time) {
        return std::nullopt;
    }

    auto name_of = [&](const char* key) {
        std::string value;
        if (require(n, {key}, path, errors)) read(n, key, path, value, errors);
        return value;
    };

    if (*type == "ControlReferenceChange") {
        validate_keys(n, {"type", "time", "device", "signal", "value"}, path, errors, warnings, strict);
        ControlReferenceChange p;
        p.time = *time;
        p.device = name_of("device");
        const std::string signal = name_of("signal");
        if (const auto ref = parse_control_reference(signal)) {
            p.signal = *ref;
        } else if (!signal.empty()) {
            push_error(errors, kDiagInvalidParameter,
                       "Unknown control reference '" + signal + "' at '" + path + "'");
        }
        if (require(n, {"value"}, path, errors)) read(n, "value", path, p.value, errors);
        return p;
    }
    if (*type == "BranchTrip") {
        validate_keys(n, {"type", "time", "branch"}, path, errors, warnings, strict);
        return BranchTrip{*time, name_of("branch")};
    }
    if (*type == "BranchImpedanceChange") {
        validate_keys(n, {"type", "time", "branch", "multiplier"}, path, errors, warnings, strict);
        BranchImpedanceChange p;
        p.time = *time;
        p.branch = name_of("branch");
        if (require(n, {"multiplier"}, path, errors)) read(n, "multiplier", path, p.multiplier, errors);
        if (p.multiplier <= 0.0) {
            push_error(errors, kDiagInvalidParameter,
                       "Impedance multiplier at '" + path + "' must be positive");
        }
        return p;
    }
    if (*type == "NetworkSwitch") {
        validate_keys(n, {"type", "time", "ybus"}, path, errors, warnings, strict);
        BusLookup lookup;
        try {
            lookup = make_bus_lookup(system);
        } catch (const BuildError& e) {
            push_error(errors, kDiagInvalidParameter, e.what());
            return std::nullopt;
        }
        const auto n_bus = static_cast<Index>(lookup.size());
        std::vector<Eigen::Triplet<Complex>> triplets;
        if (!n["ybus"]) {
            push_error(errors, kDiagMissingField, "Missing required field '" + path + ".ybus'");
        }
        for_each_entry(n["ybus"], path + ".ybus", errors, [&](const YAML::Node& e, const std::string& epath) {
            validate_keys(e, {"from", "to", "g", "b"}, epath, errors, warnings, strict);
            if (!require(e, {"from", "to"}, epath, errors)) return;
            int from = 0;
            int to = 0;
            Real g = 0.0;
            Real b = 0.0;
            read(e, "from", epath, from, errors);
            read(e, "to", epath, to, errors);
            read(e, "g", epath, g, errors);
            read(e, "b", epath, b, errors);
            const auto row = lookup.find(from);
            const auto col = lookup.find(to);
            if (row == lookup.end() || col == lookup.end()) {
                push_error(errors, kDiagInvalidParameter, "Unknown bus in '" + epath + "'");
                return;
            }
            triplets.emplace_back(row->second, col->second, Complex(g, b));
        });
        NetworkSwitch p;
        p.time = *time;
        p.ybus.resize(n_bus, n_bus);
        p.ybus.setFromTriplets(triplets.begin(), triplets.end());
        p.ybus.makeCompressed();
        return p;
    }
    if (*type == "LoadChange") {
        validate_keys(n, {"type", "time", "load", "variable", "value"}, path, errors, warnings, strict);
        LoadChange p;
        p.time = *time;
        p.load = name_of("load");
        const std::string variable = name_of("variable");
        if (variable == "Q") {
            p.variable = LoadVariable::Q;
        } else if (variable != "P" && !variable.empty()) {
            push_error(errors, kDiagInvalidParameter,
                       "Load variable at '" + path + "' must be P or Q");
        }
        if (require(n, {"value"}, path, errors)) read(n, "value", path, p.value, errors);
        return p;
    }
    if (*type == "LoadTrip") {
        validate_keys(n, {"type", "time", "load"}, path, errors, warnings, strict);
        return LoadTrip{*time, name_of("load")};
    }
    if (*type == "SourceBusVoltageChange") {
        validate_keys(n, {"type", "time", "source", "variable", "value"}, path, errors, warnings, strict);
        SourceBusVoltageChange p;
        p.time = *time;
        p.source = name_of("source");
        const std::string variable = name_of("variable");
        if (variable == "theta_ref") {
            p.variable = SourceVariable::Angle;
        } else if (variable != "V_ref" && !variable.empty()) {
            push_error(errors, kDiagInvalidParameter,
                       "Source variable at '" + path + "' must be V_ref or theta_ref");
        }
        if (require(n, {"value"}, path, errors)) read(n, "value", path, p.value, errors);
        return p;
    }
    if (*type == "GeneratorTrip") {
        validate_keys(n, {"type", "time", "device"}, path, errors, warnings, strict);
        return GeneratorTrip{*time, name_of("device")};
    }

    push_error(errors, kDiagUnsupportedPerturbation,
               "Unsupported perturbation type '" + *type + "' at '" + path + "'");
    return std::nullopt;
}

void parse_simulation(const YAML::Node& node, SimulationOptions& options, Messages& errors,
                      Messages& warnings, bool strict) {
    validate_keys(node,
                  {"tspan", "solver", "abstol", "reltol", "dt_initial", "dt_min", "dt_max",
                   "max_steps", "initialize", "initial_guess", "system_to_file",
                   "simulation_folder", "stability_tolerance"},
                  "simulation", errors, warnings, strict);

    if (const YAML::Node tspan = node["tspan"]) {
        if (!tspan.IsSequence() || tspan.size() != 2) {
            push_type_mismatch_error(errors, "simulation.tspan", "sequence of two numbers", tspan);
        } else {
            const auto t0 = parse_real(tspan[0], "simulation.tspan[0]", errors);
            const auto tf = parse_real(tspan[1], "simulation.tspan[1]", errors);
            if (t0 && tf) {
                if (*tf <= *t0) {
                    push_error(errors, kDiagInvalidParameter, "simulation.tspan must be increasing");
                }
                options.tspan = {*t0, *tf};
            }
        }
    }

    if (const auto solver = parse_string(node["solver"], "simulation.solver", errors)) {
        if (*solver == "bdf") {
            options.backend = DaeBackend::NativeBdf;
        } else if (*solver == "ida") {
            options.backend = DaeBackend::Ida;
        } else {
            push_error(errors, kDiagInvalidParameter,
                       "Unknown solver '" + *solver + "' (expected bdf or ida)");
        }
    }

    read(node, "abstol", "simulation", options.solver.abstol, errors);
    read(node, "reltol", "simulation", options.solver.reltol, errors);
    read(node, "dt_initial", "simulation", options.solver.timestep.dt_initial, errors);
    read(node, "dt_min", "simulation", options.solver.timestep.dt_min, errors);
    read(node, "dt_max", "simulation", options.solver.timestep.dt_max, errors);
    read(node, "max_steps", "simulation", options.solver.max_steps, errors);
    read(node, "initialize", "simulation", options.initialize, errors);
    read(node, "system_to_file", "simulation", options.system_to_file, errors);
    read(node, "stability_tolerance", "simulation", options.small_signal.stability_tolerance, errors);

    std::string folder;
    read(node, "simulation_folder", "simulation", folder, errors);
    if (!folder.empty()) {
        options.simulation_folder = folder;
    }

    if (const YAML::Node guess = node["initial_guess"]) {
        if (!guess.IsSequence()) {
            push_type_mismatch_error(errors, "simulation.initial_guess", "sequence", guess);
        } else {
            Vector x(static_cast<Eigen::Index>(guess.size()));
            for (std::size_t i = 0; i < guess.size(); ++i) {
                const auto v = parse_real(guess[i], "simulation.initial_guess[" + std::to_string(i) + "]",
                                          errors);
                x[static_cast<Eigen::Index>(i)] = v.value_or(0.0);
            }
            options.initial_guess = std::move(x);
        }
    }
}

}  // namespace

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

SimulationCase YamlParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        errors_.push_back("Cannot open file: " + path.string());
        return {};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

SimulationCase YamlParser::load_string(const std::string& content) {
    SimulationCase sim_case;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, sim_case);
    return sim_case;
}

void YamlParser::parse_yaml(const std::string& content, SimulationCase& sim_case) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, {"schema", "version", "system", "perturbations", "simulation"},
                  "root", errors_, warnings_, options_.strict);

    if (!root["schema"]) {
        errors_.push_back("Missing required field 'schema'");
        return;
    }
    const auto schema = parse_string(root["schema"], "schema", errors_);
    if (!schema || *schema != kSchemaId) {
        errors_.push_back("Unsupported schema (expected '" + std::string(kSchemaId) + "')");
        return;
    }
    if (!root["version"]) {
        errors_.push_back("Missing required field 'version'");
        return;
    }
    const auto version = parse_int(root["version"], "version", errors_);
    if (!version || *version != 1) {
        errors_.push_back("Unsupported version (expected 1)");
        return;
    }

    if (!root["system"]) {
        errors_.push_back("Missing required field 'system'");
        return;
    }
    if (!root["system"].IsMap()) {
        push_type_mismatch_error(errors_, "system", "map", root["system"]);
        return;
    }
    parse_system(root["system"], sim_case.system, errors_, warnings_, options_.strict);

    for_each_entry(root["perturbations"], "perturbations", errors_,
                   [&](const YAML::Node& n, const std::string& path) {
        if (auto p = parse_perturbation(n, path, sim_case.system, errors_, warnings_, options_.strict)) {
            sim_case.perturbations.push_back(std::move(*p));
        }
    });

    if (const YAML::Node simulation = root["simulation"]) {
        if (!simulation.IsMap()) {
            push_type_mismatch_error(errors_, "simulation", "map", simulation);
        } else {
            parse_simulation(simulation, sim_case.options, errors_, warnings_, options_.strict);
        }
    }
}

}  // namespace powerdyn::v1::parser
