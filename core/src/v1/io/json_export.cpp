#include "powerdyn/v1/io/json_export.hpp"

#include "powerdyn/v1/components/catalogue.hpp"

#include <fstream>
#include <stdexcept>

namespace powerdyn::v1::io {

namespace {

template<typename Variant>
nlohmann::json component_json(const Variant& model) {
    nlohmann::json j;
    std::visit([&](const auto& m) {
        j["type"] = m.type_name;
        for_each_parameter(m, [&](const char* name, const Real& value) { j[name] = value; });
    }, model);
    return j;
}

nlohmann::json refs_json(const ControlRefs& refs) {
    return {{"V_ref", refs.v_ref},
            {"omega_ref", refs.omega_ref},
            {"P_ref", refs.p_ref},
            {"Q_ref", refs.q_ref}};
}

}  // namespace

nlohmann::json to_json(const PowerSystem& system) {
    nlohmann::json j;
    j["base_power"] = system.constants.base_power;
    j["frequency"] = system.constants.frequency;

    auto& buses = j["buses"] = nlohmann::json::array();
    for (const auto& bus : system.buses) {
        buses.push_back({{"number", bus.number},
                         {"name", bus.name},
                         {"base_voltage", bus.base_voltage},
                         {"magnitude", bus.magnitude},
                         {"angle", bus.angle},
                         {"bus_type", to_string(bus.bus_type)}});
    }

    auto& lines = j["lines"] = nlohmann::json::array();
    for (const auto& line : system.lines) {
        lines.push_back({{"name", line.name}, {"from", line.from}, {"to", line.to},
                         {"r", line.r}, {"x", line.x}, {"b", line.b},
                         {"available", line.available}});
    }

    auto& dynamic_lines = j["dynamic_lines"] = nlohmann::json::array();
    for (const auto& line : system.dynamic_lines) {
        dynamic_lines.push_back({{"name", line.name}, {"from", line.from}, {"to", line.to},
                                 {"r", line.r}, {"x", line.x}, {"b", line.b},
                                 {"available", line.available}});
        if (!line.initial_conditions.empty()) {
            dynamic_lines.back()["initial_conditions"] = line.initial_conditions;
        }
    }

    auto& loads = j["loads"] = nlohmann::json::array();
    for (const auto& load : system.loads) {
        loads.push_back({{"name", load.name}, {"bus", load.bus}, {"P", load.P}, {"Q", load.Q},
                         {"available", load.available}});
    }

    auto& sources = j["sources"] = nlohmann::json::array();
    for (const auto& source : system.sources) {
        sources.push_back({{"name", source.name}, {"bus", source.bus},
                           {"V_ref", source.V_ref}, {"theta_ref", source.theta_ref},
                           {"R_th", source.R_th}, {"X_th", source.X_th},
                           {"available", source.available}});
    }

    auto& generators = j["generators"] = nlohmann::json::array();
    for (const auto& gen : system.generators) {
        nlohmann::json g = {{"name", gen.name},
                            {"bus", gen.bus},
                            {"base_power", gen.base_power},
                            {"available", gen.available}};
        g.update(refs_json(gen.refs));
        g["machine"] = component_json(gen.machine);
        g["shaft"] = component_json(gen.shaft);
        g["avr"] = component_json(gen.avr);
        g["tg"] = component_json(gen.tg);
        g["pss"] = component_json(gen.pss);
        if (!gen.initial_conditions.empty()) g["initial_conditions"] = gen.initial_conditions;
        generators.push_back(std::move(g));
    }

    auto& inverters = j["inverters"] = nlohmann::json::array();
    for (const auto& inv : system.inverters) {
        nlohmann::json v = {{"name", inv.name},
                            {"bus", inv.bus},
                            {"base_power", inv.base_power},
                            {"available", inv.available}};
        v.update(refs_json(inv.refs));
        v["converter"] = component_json(inv.converter);
        v["outer_control"] = component_json(inv.outer_control);
        v["inner_control"] = component_json(inv.inner_control);
        v["dc_source"] = component_json(inv.dc_source);
        v["freq_estimator"] = component_json(inv.freq_estimator);
        v["filter"] = component_json(inv.filter);
        if (!inv.initial_conditions.empty()) v["initial_conditions"] = inv.initial_conditions;
        inverters.push_back(std::move(v));
    }

    return j;
}

void write_system_json(const PowerSystem& system, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }
    file << to_json(system).dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("Failed writing " + path.string());
    }
}

}  // namespace powerdyn::v1::io
