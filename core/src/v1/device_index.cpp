#include "powerdyn/v1/device_index.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace powerdyn::v1 {

std::span<const ComponentKind> evaluation_chain(DeviceCategory category) noexcept {
    if (category == DeviceCategory::Generator) {
        return {generator_chain.data(), generator_chain.size()};
    }
    return {inverter_chain.data(), inverter_chain.size()};
}

const ComponentSlot& DeviceIndex::slot(ComponentKind kind) const {
    const auto& entry = slots_[static_cast<std::size_t>(kind)];
    if (!entry) {
        throw std::logic_error("device '" + name + "' has no registered " +
                               to_string(kind) + " component");
    }
    return *entry;
}

std::optional<Index> DeviceIndex::local_index(std::string_view state) const {
    const auto it = std::find(states.begin(), states.end(), state);
    if (it == states.end()) {
        return std::nullopt;
    }
    return static_cast<Index>(std::distance(states.begin(), it));
}

DeviceIndex DeviceIndexBuilder::build(std::string name,
                                      DeviceCategory category,
                                      std::vector<std::string> device_states,
                                      const std::vector<ComponentDescriptor>& components,
                                      const ControlRefs& refs) {
    DeviceIndex index;
    index.name = std::move(name);
    index.category = category;
    index.states = std::move(device_states);
    index.refs = refs;

    {
        std::set<std::string> seen;
        for (const auto& s : index.states) {
            if (!seen.insert(s).second) {
                throw IndexingError("device '" + index.name + "' declares state '" + s +
                                    "' more than once");
            }
        }
    }

    const auto chain = evaluation_chain(category);
    std::vector<int> claimed_by(index.states.size(), -1);

    for (std::size_t c = 0; c < components.size(); ++c) {
        const auto& component = components[c];
        if (std::find(chain.begin(), chain.end(), component.kind) == chain.end()) {
            throw IndexingError("device '" + index.name + "': " + to_string(component.kind) +
                                " component '" + component.type_name +
                                "' is not part of the " + to_string(category) + " chain");
        }
        auto& entry = index.slots_[static_cast<std::size_t>(component.kind)];
        if (entry) {
            throw IndexingError("device '" + index.name + "' registers more than one " +
                                std::string(to_string(component.kind)) + " component");
        }

        ComponentSlot slot;
        slot.kind = component.kind;

        // Own states must resolve, and at most one component may claim each
        slot.local_ix.reserve(component.states.size());
        for (const auto& s : component.states) {
            const auto ix = index.local_index(s);
            if (!ix) {
                throw IndexingError("device '" + index.name + "': state '" + s + "' of " +
                                    component.type_name + " is not a device state");
            }
            auto& owner = claimed_by[static_cast<std::size_t>(*ix)];
            if (owner >= 0) {
                throw IndexingError("device '" + index.name + "': state '" + s +
                                    "' is claimed by both " +
                                    components[static_cast<std::size_t>(owner)].type_name +
                                    " and " + component.type_name);
            }
            owner = static_cast<int>(c);
            slot.local_ix.push_back(*ix);
        }

        // Ports are optional; matched ports keep declaration order
        slot.port_position.assign(component.ports.size(), unresolved_port);
        for (std::size_t p = 0; p < component.ports.size(); ++p) {
            const auto ix = index.local_index(component.ports[p]);
            if (!ix) continue;
            slot.port_position[p] = static_cast<Index>(slot.port_ix.size());
            slot.port_ix.push_back(*ix);
        }

        entry = std::move(slot);
    }

    for (const auto kind : chain) {
        if (index.has_component(kind)) {
            index.order_.push_back(kind);
        }
    }
    return index;
}

void StateRegistry::add(const std::string& device, Index offset,
                        const std::vector<std::string>& states) {
    if (contains(device)) {
        throw IndexingError("duplicate device name '" + device + "' in state registry");
    }
    auto& entries = devices_[device];
    for (std::size_t i = 0; i < states.size(); ++i) {
        entries[states[i]] = offset + static_cast<Index>(i);
    }
}

std::optional<Index> StateRegistry::find(const std::string& device,
                                         const std::string& state) const {
    const auto dev = devices_.find(device);
    if (dev == devices_.end()) return std::nullopt;
    const auto it = dev->second.find(state);
    if (it == dev->second.end()) return std::nullopt;
    return it->second;
}

Index StateRegistry::at(const std::string& device, const std::string& state) const {
    const auto ix = find(device, state);
    if (!ix) {
        throw std::out_of_range("no state '" + state + "' registered for device '" + device + "'");
    }
    return *ix;
}

}  // namespace powerdyn::v1
