#pragma once

// =============================================================================
// powerdyn - Synchronous Generator Sub-Models
// =============================================================================
// Machine, shaft, excitation (AVR), turbine-governor and stabilizer leaves.
// All quantities are per unit on the device base; currents are scaled to the
// system base when they are injected into the network.
//
// Inner-variable flow inside one evaluation (see generator_chain):
//   TG      -> tau_m
//   PSS     -> v_pss          (reads tau_m)
//   AVR     -> v_f            (reads v_r, v_i, v_pss)
//   Machine -> tau_e, i_d, i_q, psi_d, psi_q   (reads v_f)
//   Shaft   -> (reads tau_m, tau_e)
// =============================================================================

#include "powerdyn/v1/components/base.hpp"

#include <cmath>
#include <variant>

namespace powerdyn::v1 {

// =============================================================================
// Machines
// =============================================================================

/// Classical machine: constant EMF behind transient reactance
struct BaseMachine {
    static constexpr ComponentKind kind = ComponentKind::Machine;
    static constexpr const char* type_name = "BaseMachine";

    Real R = 0.0;
    Real Xd_p = 0.2;
    Real eq_p = 1.0;

    [[nodiscard]] ComponentSignature signature() const {
        return {{}, {"delta", "omega"}, {}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const T& delta = f.port(slot, 0);
        const T v_r = f.inner[generator_var::v_r];
        const T v_i = f.inner[generator_var::v_i];
        const auto [v_d, v_q] = ri_dq(delta, v_r, v_i);

        const Real den = R * R + Xd_p * Xd_p;
        const T i_d = (Xd_p * (eq_p - v_q) - R * v_d) / den;
        const T i_q = (Xd_p * v_d + R * (eq_p - v_q)) / den;
        const T p_e = (v_d + R * i_d) * i_d + (v_q + R * i_q) * i_q;

        f.inner[generator_var::tau_e] = p_e;
        f.inner[generator_var::i_d] = i_d;
        f.inner[generator_var::i_q] = i_q;
        f.inner[generator_var::psi_d] = v_q + R * i_q;
        f.inner[generator_var::psi_q] = -(v_d + R * i_d);

        const auto [i_r, i_i] = dq_ri(delta, i_d, i_q);
        f.current_r += f.base_power_ratio * i_r;
        f.current_i += f.base_power_ratio * i_i;
    }
};

/// Two-axis transient model (one d-axis and one q-axis circuit)
struct OneDOneQMachine {
    static constexpr ComponentKind kind = ComponentKind::Machine;
    static constexpr const char* type_name = "OneDOneQMachine";

    Real R = 0.0;
    Real Xd = 1.3125;
    Real Xq = 1.2578;
    Real Xd_p = 0.1813;
    Real Xq_p = 0.25;
    Real Td0_p = 5.89;
    Real Tq0_p = 0.6;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"eq_p", "ed_p"}, {"delta", "omega"}, {1.0, 0.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const T& eq_p = f.local(slot, 0);
        const T& ed_p = f.local(slot, 1);
        const T& delta = f.port(slot, 0);
        const T v_f = f.inner[generator_var::v_f];
        const T v_r = f.inner[generator_var::v_r];
        const T v_i = f.inner[generator_var::v_i];
        const auto [v_d, v_q] = ri_dq(delta, v_r, v_i);

        const Real den = R * R + Xd_p * Xq_p;
        const T i_d = (Xq_p * (eq_p - v_q) + R * (ed_p - v_d)) / den;
        const T i_q = (-Xd_p * (ed_p - v_d) + R * (eq_p - v_q)) / den;
        const T p_e = (v_d + R * i_d) * i_d + (v_q + R * i_q) * i_q;

        f.dxdt(slot, 0) = (-eq_p - (Xd - Xd_p) * i_d + v_f) / Td0_p;
        f.dxdt(slot, 1) = (-ed_p + (Xq - Xq_p) * i_q) / Tq0_p;

        f.inner[generator_var::tau_e] = p_e;
        f.inner[generator_var::i_d] = i_d;
        f.inner[generator_var::i_q] = i_q;
        f.inner[generator_var::psi_d] = v_q + R * i_q;
        f.inner[generator_var::psi_q] = -(v_d + R * i_d);

        const auto [i_r, i_i] = dq_ri(delta, i_d, i_q);
        f.current_r += f.base_power_ratio * i_r;
        f.current_i += f.base_power_ratio * i_i;
    }
};

// =============================================================================
// Shafts
// =============================================================================

struct SingleMass {
    static constexpr ComponentKind kind = ComponentKind::Shaft;
    static constexpr const char* type_name = "SingleMass";

    Real H = 3.01;  // inertia constant (s)
    Real D = 0.0;   // damping (pu)

    [[nodiscard]] ComponentSignature signature() const {
        return {{"delta", "omega"}, {}, {0.0, 1.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const T& omega = f.local(slot, 1);
        const Real omega_sys = f.constants.omega_sys;
        const T tau_m = f.inner[generator_var::tau_m];
        const T tau_e = f.inner[generator_var::tau_e];

        f.dxdt(slot, 0) = f.constants.omega_base() * (omega - omega_sys);
        f.dxdt(slot, 1) = (tau_m - tau_e - D * (omega - omega_sys)) / (2.0 * H);
    }
};

// =============================================================================
// Excitation Systems
// =============================================================================

struct AVRFixed {
    static constexpr ComponentKind kind = ComponentKind::AVR;
    static constexpr const char* type_name = "AVRFixed";

    Real v_fix = 1.0;

    [[nodiscard]] ComponentSignature signature() const { return {}; }

    template<typename T>
    void ode(const ComponentSlot& /*slot*/, DeviceFrame<T>& f) const {
        f.inner[generator_var::v_f] = T(v_fix);
    }
};

/// Integral voltage regulator acting directly on the field voltage
struct AVRSimple {
    static constexpr ComponentKind kind = ComponentKind::AVR;
    static constexpr const char* type_name = "AVRSimple";

    Real Kv = 1.0;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"Vf"}, {}, {1.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        using std::sqrt;
        const T& v_fd = f.local(slot, 0);
        const T v_r = f.inner[generator_var::v_r];
        const T v_i = f.inner[generator_var::v_i];
        const T v_th = sqrt(v_r * v_r + v_i * v_i);

        f.dxdt(slot, 0) = Kv * (f.refs.v_ref - v_th);
        f.inner[generator_var::v_f] = v_fd;
    }
};

/// IEEE type I exciter without limiters
struct AVRTypeI {
    static constexpr ComponentKind kind = ComponentKind::AVR;
    static constexpr const char* type_name = "AVRTypeI";

    Real Ka = 20.0;
    Real Ke = 0.01;
    Real Kf = 0.063;
    Real Ta = 0.2;
    Real Te = 0.314;
    Real Tf = 0.35;
    Real Tr = 0.001;
    Real Ae = 0.0039;
    Real Be = 1.555;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"Vf", "Vr1", "Vr2", "Vm"}, {}, {1.0, 0.0, 0.0, 1.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        using std::abs;
        using std::exp;
        using std::sqrt;
        const T& v_fd = f.local(slot, 0);
        const T& v_r1 = f.local(slot, 1);
        const T& v_r2 = f.local(slot, 2);
        const T& v_m = f.local(slot, 3);

        const T v_r = f.inner[generator_var::v_r];
        const T v_i = f.inner[generator_var::v_i];
        const T v_pss = f.inner[generator_var::v_pss];
        const T v_th = sqrt(v_r * v_r + v_i * v_i);
        const T s_e = Ae * exp(Be * abs(v_fd));

        f.dxdt(slot, 0) = (v_r1 - Ke * v_fd - v_fd * s_e) / Te;
        f.dxdt(slot, 1) =
            (Ka * (f.refs.v_ref + v_pss - v_m - v_r2 - (Kf / Tf) * v_fd) - v_r1) / Ta;
        f.dxdt(slot, 2) = -((Kf / Tf) * v_fd + v_r2) / Tf;
        f.dxdt(slot, 3) = (v_th - v_m) / Tr;

        f.inner[generator_var::v_f] = v_fd;
    }
};

// =============================================================================
// Turbine Governors
// =============================================================================

struct TGFixed {
    static constexpr ComponentKind kind = ComponentKind::TurbineGovernor;
    static constexpr const char* type_name = "TGFixed";

    Real efficiency = 1.0;

    [[nodiscard]] ComponentSignature signature() const { return {}; }

    template<typename T>
    void ode(const ComponentSlot& /*slot*/, DeviceFrame<T>& f) const {
        f.inner[generator_var::tau_m] = T(efficiency * f.refs.p_ref);
    }
};

/// Droop governor with a lead-lag transfer function
struct TGTypeII {
    static constexpr ComponentKind kind = ComponentKind::TurbineGovernor;
    static constexpr const char* type_name = "TGTypeII";

    Real R = 0.02;
    Real T1 = 1.0;
    Real T2 = 0.1;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"xg"}, {"omega"}, {0.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const T& xg = f.local(slot, 0);
        const T& omega = f.port(slot, 0);
        const Real inv_r = R < 1e-12 ? 0.0 : 1.0 / R;
        const T d_omega = f.refs.omega_ref - omega;

        f.dxdt(slot, 0) = (inv_r * (1.0 - T1 / T2) * d_omega - xg) / T2;
        f.inner[generator_var::tau_m] = xg + inv_r * (T1 / T2) * d_omega + f.refs.p_ref;
    }
};

// =============================================================================
// Power System Stabilizers
// =============================================================================

struct PSSFixed {
    static constexpr ComponentKind kind = ComponentKind::PSS;
    static constexpr const char* type_name = "PSSFixed";

    Real v_pss = 0.0;

    [[nodiscard]] ComponentSignature signature() const { return {}; }

    template<typename T>
    void ode(const ComponentSlot& /*slot*/, DeviceFrame<T>& f) const {
        f.inner[generator_var::v_pss] = T(v_pss);
    }
};

/// Proportional stabilizer on speed deviation and accelerating power
struct PSSSimple {
    static constexpr ComponentKind kind = ComponentKind::PSS;
    static constexpr const char* type_name = "PSSSimple";

    Real K_omega = 0.0;
    Real K_p = 0.0;

    [[nodiscard]] ComponentSignature signature() const {
        return {{}, {"omega"}, {}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const Real omega_sys = f.constants.omega_sys;
        const T omega = f.port_or(slot, 0, omega_sys);
        const T tau_m = f.inner[generator_var::tau_m];
        f.inner[generator_var::v_pss] =
            K_omega * (omega - omega_sys) + K_p * (tau_m - f.refs.p_ref);
    }
};

// =============================================================================
// Model Variants
// =============================================================================

using MachineModel = std::variant<BaseMachine, OneDOneQMachine>;
using ShaftModel = std::variant<SingleMass>;
using AVRModel = std::variant<AVRFixed, AVRSimple, AVRTypeI>;
using TurbineGovernorModel = std::variant<TGFixed, TGTypeII>;
using PSSModel = std::variant<PSSFixed, PSSSimple>;

}  // namespace powerdyn::v1
