#pragma once

// =============================================================================
// powerdyn - Dynamic Component Foundation
// =============================================================================
// Every sub-model of a dynamic injection (machine, shaft, AVR, ...) is a leaf
// computation with one calling contract: it reads its own states and its port
// states out of the parent device's local state slice, reads and writes the
// device's inner-variable buffer, and writes its derivatives into the device's
// output slice. The index arithmetic is resolved once at build time and is
// carried by ComponentSlot; the hot path performs no name comparisons.
// =============================================================================

#include "powerdyn/v1/numeric_types.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace powerdyn::v1 {

// =============================================================================
// Component Categories
// =============================================================================

enum class ComponentKind : std::uint8_t {
    Machine,
    Shaft,
    AVR,
    TurbineGovernor,
    PSS,
    OuterControl,
    InnerControl,
    DCSource,
    FrequencyEstimator,
    Converter,
    Filter
};

inline constexpr std::size_t component_kind_count = 11;

[[nodiscard]] constexpr const char* to_string(ComponentKind kind) noexcept {
    switch (kind) {
        case ComponentKind::Machine: return "machine";
        case ComponentKind::Shaft: return "shaft";
        case ComponentKind::AVR: return "avr";
        case ComponentKind::TurbineGovernor: return "tg";
        case ComponentKind::PSS: return "pss";
        case ComponentKind::OuterControl: return "outer_control";
        case ComponentKind::InnerControl: return "inner_control";
        case ComponentKind::DCSource: return "dc_source";
        case ComponentKind::FrequencyEstimator: return "freq_estimator";
        case ComponentKind::Converter: return "converter";
        case ComponentKind::Filter: return "filter";
    }
    return "unknown";
}

/// Evaluation order of generator sub-models inside one residual call
inline constexpr std::array<ComponentKind, 5> generator_chain = {
    ComponentKind::TurbineGovernor,
    ComponentKind::PSS,
    ComponentKind::AVR,
    ComponentKind::Machine,
    ComponentKind::Shaft,
};

/// Evaluation order of inverter sub-models inside one residual call
inline constexpr std::array<ComponentKind, 6> inverter_chain = {
    ComponentKind::DCSource,
    ComponentKind::FrequencyEstimator,
    ComponentKind::OuterControl,
    ComponentKind::InnerControl,
    ComponentKind::Converter,
    ComponentKind::Filter,
};

// =============================================================================
// Inner Variables
// =============================================================================

/// Slots of the generator inner-variable buffer
namespace generator_var {
enum : std::size_t {
    tau_e,
    tau_m,
    v_f,
    v_pss,
    v_r,
    v_i,
    psi_d,
    psi_q,
    i_d,
    i_q,
    v_h,
    count
};
}  // namespace generator_var

/// Slots of the inverter inner-variable buffer
namespace inverter_var {
enum : std::size_t {
    m_d,
    m_q,
    v_dc,
    v_r_cnv,
    v_i_cnv,
    theta_oc,
    omega_oc,
    v_oc,
    omega_freq_estimator,
    theta_freq_estimator,
    v_r,
    v_i,
    p_elec,
    q_elec,
    count
};
}  // namespace inverter_var

static_assert(generator_var::count == 11);
static_assert(inverter_var::count == 14);

// =============================================================================
// Control References and System Constants
// =============================================================================

enum class ControlReference : std::uint8_t {
    VoltageRef,
    FrequencyRef,
    ActivePowerRef,
    ReactivePowerRef
};

[[nodiscard]] constexpr const char* to_string(ControlReference ref) noexcept {
    switch (ref) {
        case ControlReference::VoltageRef: return "V_ref";
        case ControlReference::FrequencyRef: return "omega_ref";
        case ControlReference::ActivePowerRef: return "P_ref";
        case ControlReference::ReactivePowerRef: return "Q_ref";
    }
    return "unknown";
}

/// Operating-point setpoints captured when a device is indexed
struct ControlRefs {
    Real v_ref = 1.0;
    Real omega_ref = 1.0;
    Real p_ref = 0.0;
    Real q_ref = 0.0;

    [[nodiscard]] Real get(ControlReference ref) const noexcept {
        switch (ref) {
            case ControlReference::VoltageRef: return v_ref;
            case ControlReference::FrequencyRef: return omega_ref;
            case ControlReference::ActivePowerRef: return p_ref;
            case ControlReference::ReactivePowerRef: return q_ref;
        }
        return 0.0;
    }

    void set(ControlReference ref, Real value) noexcept {
        switch (ref) {
            case ControlReference::VoltageRef: v_ref = value; break;
            case ControlReference::FrequencyRef: omega_ref = value; break;
            case ControlReference::ActivePowerRef: p_ref = value; break;
            case ControlReference::ReactivePowerRef: q_ref = value; break;
        }
    }
};

struct SystemConstants {
    Real base_power = 100.0;   // MVA
    Real frequency = 60.0;     // Hz
    Real omega_sys = 1.0;      // reference frame speed (pu)

    [[nodiscard]] Real omega_base() const noexcept {
        return base_angular_frequency(frequency);
    }
};

// =============================================================================
// Component Slot (resolved indices)
// =============================================================================

inline constexpr Index unresolved_port = -1;

/// Resolved index set of one sub-component inside its parent device
struct ComponentSlot {
    ComponentKind kind = ComponentKind::Machine;
    std::vector<Index> local_ix;       // own states -> device-local positions
    std::vector<Index> port_ix;        // matched ports, in declaration order
    std::vector<Index> port_position;  // declared port k -> entry of port_ix or -1
};

// =============================================================================
// Device Frame
// =============================================================================

/// Per-device view handed to each sub-model during one residual evaluation
template<typename T>
struct DeviceFrame {
    std::span<const T> states;
    std::span<T> output;
    std::span<T> inner;
    const ControlRefs& refs;
    const SystemConstants& constants;
    Real base_power_ratio = 1.0;  // device base / system base
    T& current_r;
    T& current_i;

    [[nodiscard]] const T& local(const ComponentSlot& slot, std::size_t k) const {
        return states[static_cast<std::size_t>(slot.local_ix[k])];
    }

    [[nodiscard]] T& dxdt(const ComponentSlot& slot, std::size_t k) const {
        return output[static_cast<std::size_t>(slot.local_ix[k])];
    }

    [[nodiscard]] bool has_port(const ComponentSlot& slot, std::size_t declared) const {
        return declared < slot.port_position.size() &&
               slot.port_position[declared] != unresolved_port;
    }

    /// Value of the declared port `declared`; an unwired port is a programming error
    [[nodiscard]] const T& port(const ComponentSlot& slot, std::size_t declared) const {
        if (!has_port(slot, declared)) {
            throw std::logic_error(std::string("unresolved port on ") + to_string(slot.kind));
        }
        const auto compact = static_cast<std::size_t>(slot.port_position[declared]);
        return states[static_cast<std::size_t>(slot.port_ix[compact])];
    }

    [[nodiscard]] T port_or(const ComponentSlot& slot, std::size_t declared, Real fallback) const {
        if (!has_port(slot, declared)) {
            return T(fallback);
        }
        return port(slot, declared);
    }
};

// =============================================================================
// Reference Frame Rotations
// =============================================================================

/// Network (R, I) to machine (d, q) frame at angle delta
template<typename T>
[[nodiscard]] inline std::pair<T, T> ri_dq(const T& delta, const T& x_r, const T& x_i) {
    using std::cos;
    using std::sin;
    const T s = sin(delta);
    const T c = cos(delta);
    const T d = s * x_r - c * x_i;
    const T q = c * x_r + s * x_i;
    return {d, q};
}

/// Machine (d, q) to network (R, I) frame at angle delta
template<typename T>
[[nodiscard]] inline std::pair<T, T> dq_ri(const T& delta, const T& x_d, const T& x_q) {
    using std::cos;
    using std::sin;
    const T s = sin(delta);
    const T c = cos(delta);
    const T r = s * x_d + c * x_q;
    const T i = -c * x_d + s * x_q;
    return {r, i};
}

/// Shared naming contract for all sub-model parameter structs
struct ComponentSignature {
    std::vector<std::string> states;
    std::vector<std::string> ports;
    std::vector<Real> initial_guess;
};

}  // namespace powerdyn::v1
