#pragma once

// =============================================================================
// powerdyn - Device State Indexing
// =============================================================================
// Resolves, once per dynamic injection, where each sub-component's own states
// and input ports live inside the device's local state vector. The result is
// a set of plain integer slices (ComponentSlot) keyed by component category;
// residual evaluation only ever reads these slices.
// =============================================================================

#include "powerdyn/v1/components/base.hpp"
#include "powerdyn/v1/diagnostics.hpp"

#include <array>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace powerdyn::v1 {

enum class DeviceCategory : std::uint8_t {
    Generator,
    Inverter
};

[[nodiscard]] constexpr const char* to_string(DeviceCategory category) noexcept {
    switch (category) {
        case DeviceCategory::Generator: return "generator";
        case DeviceCategory::Inverter: return "inverter";
    }
    return "unknown";
}

/// Canonical sub-model evaluation order of a device category
[[nodiscard]] std::span<const ComponentKind> evaluation_chain(DeviceCategory category) noexcept;

/// Size of the inner-variable buffer of a device category
[[nodiscard]] constexpr std::size_t inner_variable_count(DeviceCategory category) noexcept {
    return category == DeviceCategory::Generator ? generator_var::count : inverter_var::count;
}

/// Naming contract of one sub-component as seen by the index builder
struct ComponentDescriptor {
    ComponentKind kind = ComponentKind::Machine;
    std::string type_name;
    std::vector<std::string> states;
    std::vector<std::string> ports;
};

// =============================================================================
// Device Index
// =============================================================================

class DeviceIndex {
public:
    std::string name;
    DeviceCategory category = DeviceCategory::Generator;
    std::vector<std::string> states;  // device local state names, in local order
    ControlRefs refs;                 // snapshot taken at build time
    Index offset = 0;                 // global index of the first local state

    [[nodiscard]] Index size() const { return static_cast<Index>(states.size()); }
    [[nodiscard]] std::size_t inner_size() const { return inner_variable_count(category); }

    [[nodiscard]] bool has_component(ComponentKind kind) const {
        return slots_[static_cast<std::size_t>(kind)].has_value();
    }

    /// Resolved slot of a registered component; unregistered lookups throw std::logic_error
    [[nodiscard]] const ComponentSlot& slot(ComponentKind kind) const;

    [[nodiscard]] const std::vector<Index>& local_state_ix(ComponentKind kind) const {
        return slot(kind).local_ix;
    }

    [[nodiscard]] const std::vector<Index>& input_port_ix(ComponentKind kind) const {
        return slot(kind).port_ix;
    }

    /// Registered components in canonical chain order
    [[nodiscard]] const std::vector<ComponentKind>& evaluation_order() const { return order_; }

    /// Local position of a named state, if the device declares it
    [[nodiscard]] std::optional<Index> local_index(std::string_view state) const;

private:
    friend class DeviceIndexBuilder;

    std::array<std::optional<ComponentSlot>, component_kind_count> slots_{};
    std::vector<ComponentKind> order_;
};

// =============================================================================
// Device Index Builder
// =============================================================================

class DeviceIndexBuilder {
public:
    /// Build the index of one device. Throws IndexingError when a component
    /// state is not declared by the device, when two components claim the same
    /// state, or when a component does not belong to the category's chain.
    [[nodiscard]] static DeviceIndex build(std::string name,
                                           DeviceCategory category,
                                           std::vector<std::string> device_states,
                                           const std::vector<ComponentDescriptor>& components,
                                           const ControlRefs& refs);
};

// =============================================================================
// Global State Registry
// =============================================================================

/// device name -> state name -> global index
class StateRegistry {
public:
    void add(const std::string& device, Index offset, const std::vector<std::string>& states);

    [[nodiscard]] std::optional<Index> find(const std::string& device,
                                            const std::string& state) const;

    /// Throws std::out_of_range for unknown device/state pairs
    [[nodiscard]] Index at(const std::string& device, const std::string& state) const;

    [[nodiscard]] bool contains(const std::string& device) const {
        return devices_.find(device) != devices_.end();
    }

    [[nodiscard]] const std::map<std::string, std::map<std::string, Index>>& devices() const {
        return devices_;
    }

private:
    std::map<std::string, std::map<std::string, Index>> devices_;
};

}  // namespace powerdyn::v1
