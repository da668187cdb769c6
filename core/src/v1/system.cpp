#include "powerdyn/v1/system.hpp"

#include <algorithm>

namespace powerdyn::v1 {

namespace {

template<typename Variant>
ComponentDescriptor describe(const Variant& model) {
    return std::visit([](const auto& m) {
        using M = std::decay_t<decltype(m)>;
        const ComponentSignature sig = m.signature();
        return ComponentDescriptor{M::kind, M::type_name, sig.states, sig.ports};
    }, model);
}

template<typename Variant>
void append_guess(const Variant& model, std::vector<std::string>& names, std::vector<Real>& values) {
    std::visit([&](const auto& m) {
        const ComponentSignature sig = m.signature();
        for (std::size_t i = 0; i < sig.states.size(); ++i) {
            names.push_back(sig.states[i]);
            values.push_back(i < sig.initial_guess.size() ? sig.initial_guess[i] : 0.0);
        }
    }, model);
}

std::vector<std::string> concat_states(const std::vector<ComponentDescriptor>& components) {
    std::vector<std::string> states;
    for (const auto& c : components) {
        states.insert(states.end(), c.states.begin(), c.states.end());
    }
    return states;
}

/// Map per-component guesses onto the declared state order (unknown names start at 0)
std::vector<Real> align_guess(const std::vector<std::string>& declared,
                              const std::vector<std::string>& names,
                              const std::vector<Real>& values) {
    std::vector<Real> guess(declared.size(), 0.0);
    for (std::size_t i = 0; i < declared.size(); ++i) {
        const auto it = std::find(names.begin(), names.end(), declared[i]);
        if (it != names.end()) {
            guess[i] = values[static_cast<std::size_t>(std::distance(names.begin(), it))];
        }
    }
    return guess;
}

template<typename Range>
auto find_named(Range& items, const std::string& name) -> decltype(&items.front()) {
    for (auto& item : items) {
        if (item.name == name) return &item;
    }
    return nullptr;
}

}  // namespace

// =============================================================================
// DynamicGenerator
// =============================================================================

std::vector<ComponentDescriptor> DynamicGenerator::components() const {
    return {describe(machine), describe(shaft), describe(avr), describe(tg), describe(pss)};
}

std::vector<std::string> DynamicGenerator::states() const {
    if (state_override_) return *state_override_;
    return concat_states(components());
}

std::vector<Real> DynamicGenerator::initial_guess() const {
    std::vector<std::string> names;
    std::vector<Real> values;
    append_guess(machine, names, values);
    append_guess(shaft, names, values);
    append_guess(avr, names, values);
    append_guess(tg, names, values);
    append_guess(pss, names, values);
    return align_guess(states(), names, values);
}

// =============================================================================
// DynamicInverter
// =============================================================================

std::vector<ComponentDescriptor> DynamicInverter::components() const {
    return {describe(outer_control), describe(inner_control), describe(dc_source),
            describe(freq_estimator), describe(converter), describe(filter)};
}

std::vector<std::string> DynamicInverter::states() const {
    if (state_override_) return *state_override_;
    return concat_states(components());
}

std::vector<Real> DynamicInverter::initial_guess() const {
    std::vector<std::string> names;
    std::vector<Real> values;
    append_guess(outer_control, names, values);
    append_guess(inner_control, names, values);
    append_guess(dc_source, names, values);
    append_guess(freq_estimator, names, values);
    append_guess(converter, names, values);
    append_guess(filter, names, values);
    return align_guess(states(), names, values);
}

// =============================================================================
// PowerSystem lookups
// =============================================================================

Bus* PowerSystem::find_bus(int number) {
    for (auto& bus : buses) {
        if (bus.number == number) return &bus;
    }
    return nullptr;
}

Line* PowerSystem::find_line(const std::string& name) { return find_named(lines, name); }

DynamicLine* PowerSystem::find_dynamic_line(const std::string& name) {
    return find_named(dynamic_lines, name);
}

PowerLoad* PowerSystem::find_load(const std::string& name) { return find_named(loads, name); }

Source* PowerSystem::find_source(const std::string& name) { return find_named(sources, name); }

DynamicGenerator* PowerSystem::find_generator(const std::string& name) {
    return find_named(generators, name);
}

DynamicInverter* PowerSystem::find_inverter(const std::string& name) {
    return find_named(inverters, name);
}

}  // namespace powerdyn::v1
