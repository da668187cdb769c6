#pragma once

// =============================================================================
// powerdyn - Grid-Forming Inverter Sub-Models
// =============================================================================
// DC side, frequency estimator (PLL), outer loop (virtual inertia with
// reactive power droop), inner cascaded voltage/current loop, averaged
// converter and LCL output filter.
//
// Inner-variable flow inside one evaluation (see inverter_chain):
//   DC source  -> v_dc
//   PLL        -> omega_freq_estimator, theta_freq_estimator
//   Outer loop -> theta_oc, omega_oc, v_oc, p_elec, q_elec
//   Inner loop -> m_d, m_q          (reads theta_oc, omega_oc, v_oc, v_dc)
//   Converter  -> v_r_cnv, v_i_cnv  (reads m_d, m_q, v_dc, theta_oc)
//   Filter     -> terminal current  (reads v_r_cnv, v_i_cnv, v_r, v_i)
// =============================================================================

#include "powerdyn/v1/components/base.hpp"

#include <cmath>
#include <variant>

namespace powerdyn::v1 {

namespace detail {

/// Rotation into the controller frame whose d axis leads the network R axis by theta
template<typename T>
[[nodiscard]] inline std::pair<T, T> ri_to_controller(const T& theta, const T& x_r, const T& x_i) {
    const T angle = theta + pi / 2.0;
    return ri_dq(angle, x_r, x_i);
}

template<typename T>
[[nodiscard]] inline std::pair<T, T> controller_to_ri(const T& theta, const T& x_d, const T& x_q) {
    const T angle = theta + pi / 2.0;
    return dq_ri(angle, x_d, x_q);
}

}  // namespace detail

// =============================================================================
// DC Side
// =============================================================================

struct FixedDCSource {
    static constexpr ComponentKind kind = ComponentKind::DCSource;
    static constexpr const char* type_name = "FixedDCSource";

    Real voltage = 1.0;

    [[nodiscard]] ComponentSignature signature() const { return {}; }

    template<typename T>
    void ode(const ComponentSlot& /*slot*/, DeviceFrame<T>& f) const {
        f.inner[inverter_var::v_dc] = T(voltage);
    }
};

// =============================================================================
// Frequency Estimators
// =============================================================================

/// Synchronous reference frame PLL with a low-pass filtered dq voltage
struct KauraPLL {
    static constexpr ComponentKind kind = ComponentKind::FrequencyEstimator;
    static constexpr const char* type_name = "KauraPLL";

    Real omega_lp = 500.0;
    Real kp_pll = 0.084;
    Real ki_pll = 4.69;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"vd_pll", "vq_pll", "epsilon_pll", "theta_pll"},
                {"vr_filter", "vi_filter"},
                {1.0, 0.0, 0.0, 0.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        using std::atan2;
        const T& vd_pll = f.local(slot, 0);
        const T& vq_pll = f.local(slot, 1);
        const T& epsilon_pll = f.local(slot, 2);
        const T& theta_pll = f.local(slot, 3);
        const T& vr_filter = f.port(slot, 0);
        const T& vi_filter = f.port(slot, 1);

        const auto [v_d, v_q] = detail::ri_to_controller(theta_pll, vr_filter, vi_filter);
        const T phase_error = atan2(vq_pll, vd_pll);
        const T omega_pll = 1.0 + kp_pll * phase_error + ki_pll * epsilon_pll;

        f.dxdt(slot, 0) = omega_lp * (v_d - vd_pll);
        f.dxdt(slot, 1) = omega_lp * (v_q - vq_pll);
        f.dxdt(slot, 2) = phase_error;
        f.dxdt(slot, 3) = f.constants.omega_base() * (omega_pll - f.constants.omega_sys);

        f.inner[inverter_var::omega_freq_estimator] = omega_pll;
        f.inner[inverter_var::theta_freq_estimator] = theta_pll;
    }
};

// =============================================================================
// Outer Control
// =============================================================================

/// Virtual synchronous machine swing equation with Q-V droop
struct VirtualInertiaQDroop {
    static constexpr ComponentKind kind = ComponentKind::OuterControl;
    static constexpr const char* type_name = "VirtualInertiaQDroop";

    Real Ta = 2.0;
    Real kd = 400.0;
    Real k_omega = 20.0;
    Real kq = 0.2;
    Real omega_f = 1000.0;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"theta_oc", "omega_oc", "q_oc"},
                {"vr_filter", "vi_filter", "ir_filter", "ii_filter"},
                {0.0, 1.0, 0.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const T& theta_oc = f.local(slot, 0);
        const T& omega_oc = f.local(slot, 1);
        const T& q_oc = f.local(slot, 2);
        const T& vr_filter = f.port(slot, 0);
        const T& vi_filter = f.port(slot, 1);
        const T& ir_filter = f.port(slot, 2);
        const T& ii_filter = f.port(slot, 3);

        const T omega_pll = f.inner[inverter_var::omega_freq_estimator];
        const T p_elec = vr_filter * ir_filter + vi_filter * ii_filter;
        const T q_elec = vi_filter * ir_filter - vr_filter * ii_filter;

        f.dxdt(slot, 0) = f.constants.omega_base() * (omega_oc - f.constants.omega_sys);
        f.dxdt(slot, 1) = (f.refs.p_ref - p_elec - kd * (omega_oc - omega_pll) -
                           k_omega * (omega_oc - f.refs.omega_ref)) / Ta;
        f.dxdt(slot, 2) = omega_f * (q_elec - q_oc);

        f.inner[inverter_var::theta_oc] = theta_oc;
        f.inner[inverter_var::omega_oc] = omega_oc;
        f.inner[inverter_var::v_oc] = f.refs.v_ref + kq * (f.refs.q_ref - q_oc);
        f.inner[inverter_var::p_elec] = p_elec;
        f.inner[inverter_var::q_elec] = q_elec;
    }
};

// =============================================================================
// Inner Control
// =============================================================================

/// Cascaded voltage and current PI loops with virtual impedance and active damping
struct VoltageModeControl {
    static constexpr ComponentKind kind = ComponentKind::InnerControl;
    static constexpr const char* type_name = "VoltageModeControl";

    Real kpv = 0.59;
    Real kiv = 736.0;
    Real kffv = 0.0;
    Real rv = 0.0;
    Real lv = 0.2;
    Real kpc = 1.27;
    Real kic = 14.3;
    Real kffi = 0.0;
    Real omega_ad = 50.0;
    Real kad = 0.2;
    // decoupling terms, normally equal to the filter's lf and cf
    Real lf = 0.08;
    Real cf = 0.074;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"xi_d_ic", "xi_q_ic", "gamma_d_ic", "gamma_q_ic", "phi_d_ic", "phi_q_ic"},
                {"ir_cnv", "ii_cnv", "vr_filter", "vi_filter", "ir_filter", "ii_filter"},
                {0.0, 0.0, 0.0, 0.0, 0.0, 0.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const T& xi_d = f.local(slot, 0);
        const T& xi_q = f.local(slot, 1);
        const T& gamma_d = f.local(slot, 2);
        const T& gamma_q = f.local(slot, 3);
        const T& phi_d = f.local(slot, 4);
        const T& phi_q = f.local(slot, 5);

        const T theta_oc = f.inner[inverter_var::theta_oc];
        const T omega_oc = f.inner[inverter_var::omega_oc];
        const T v_oc = f.inner[inverter_var::v_oc];
        const T v_dc = f.inner[inverter_var::v_dc];

        const auto [id_cnv, iq_cnv] =
            detail::ri_to_controller(theta_oc, f.port(slot, 0), f.port(slot, 1));
        const auto [vd_filter, vq_filter] =
            detail::ri_to_controller(theta_oc, f.port(slot, 2), f.port(slot, 3));
        const auto [id_filter, iq_filter] =
            detail::ri_to_controller(theta_oc, f.port(slot, 4), f.port(slot, 5));

        // Virtual impedance
        const T vd_ref = v_oc - rv * id_filter + omega_oc * lv * iq_filter;
        const T vq_ref = -rv * iq_filter - omega_oc * lv * id_filter;

        // Voltage loop
        const T id_cnv_ref = kpv * (vd_ref - vd_filter) + kiv * xi_d -
                             cf * omega_oc * vq_filter + kffi * id_filter;
        const T iq_cnv_ref = kpv * (vq_ref - vq_filter) + kiv * xi_q +
                             cf * omega_oc * vd_filter + kffi * iq_filter;

        // Current loop with active damping
        const T vd_cnv_ref = kpc * (id_cnv_ref - id_cnv) + kic * gamma_d -
                             omega_oc * lf * iq_cnv + kffv * vd_filter -
                             kad * (vd_filter - phi_d);
        const T vq_cnv_ref = kpc * (iq_cnv_ref - iq_cnv) + kic * gamma_q +
                             omega_oc * lf * id_cnv + kffv * vq_filter -
                             kad * (vq_filter - phi_q);

        f.dxdt(slot, 0) = vd_ref - vd_filter;
        f.dxdt(slot, 1) = vq_ref - vq_filter;
        f.dxdt(slot, 2) = id_cnv_ref - id_cnv;
        f.dxdt(slot, 3) = iq_cnv_ref - iq_cnv;
        f.dxdt(slot, 4) = omega_ad * (vd_filter - phi_d);
        f.dxdt(slot, 5) = omega_ad * (vq_filter - phi_q);

        f.inner[inverter_var::m_d] = vd_cnv_ref / v_dc;
        f.inner[inverter_var::m_q] = vq_cnv_ref / v_dc;
    }
};

// =============================================================================
// Converter
// =============================================================================

struct AverageConverter {
    static constexpr ComponentKind kind = ComponentKind::Converter;
    static constexpr const char* type_name = "AverageConverter";

    Real rated_voltage = 690.0;
    Real rated_current = 2.75;

    [[nodiscard]] ComponentSignature signature() const { return {}; }

    template<typename T>
    void ode(const ComponentSlot& /*slot*/, DeviceFrame<T>& f) const {
        const T theta_oc = f.inner[inverter_var::theta_oc];
        const T v_dc = f.inner[inverter_var::v_dc];
        const T vd_cnv = f.inner[inverter_var::m_d] * v_dc;
        const T vq_cnv = f.inner[inverter_var::m_q] * v_dc;
        const auto [vr_cnv, vi_cnv] = detail::controller_to_ri(theta_oc, vd_cnv, vq_cnv);
        f.inner[inverter_var::v_r_cnv] = vr_cnv;
        f.inner[inverter_var::v_i_cnv] = vi_cnv;
    }
};

// =============================================================================
// Output Filter
// =============================================================================

struct LCLFilter {
    static constexpr ComponentKind kind = ComponentKind::Filter;
    static constexpr const char* type_name = "LCLFilter";

    Real lf = 0.08;
    Real rf = 0.003;
    Real cf = 0.074;
    Real lg = 0.2;
    Real rg = 0.01;

    [[nodiscard]] ComponentSignature signature() const {
        return {{"ir_cnv", "ii_cnv", "vr_filter", "vi_filter", "ir_filter", "ii_filter"},
                {},
                {0.0, 0.0, 1.0, 0.0, 0.0, 0.0}};
    }

    template<typename T>
    void ode(const ComponentSlot& slot, DeviceFrame<T>& f) const {
        const T& ir_cnv = f.local(slot, 0);
        const T& ii_cnv = f.local(slot, 1);
        const T& vr_filter = f.local(slot, 2);
        const T& vi_filter = f.local(slot, 3);
        const T& ir_filter = f.local(slot, 4);
        const T& ii_filter = f.local(slot, 5);

        const T vr_cnv = f.inner[inverter_var::v_r_cnv];
        const T vi_cnv = f.inner[inverter_var::v_i_cnv];
        const T v_r = f.inner[inverter_var::v_r];
        const T v_i = f.inner[inverter_var::v_i];
        const Real omega_b = f.constants.omega_base();
        const Real omega = f.constants.omega_sys;

        f.dxdt(slot, 0) = (omega_b / lf) * (vr_cnv - vr_filter - rf * ir_cnv + omega * lf * ii_cnv);
        f.dxdt(slot, 1) = (omega_b / lf) * (vi_cnv - vi_filter - rf * ii_cnv - omega * lf * ir_cnv);
        f.dxdt(slot, 2) = (omega_b / cf) * (ir_cnv - ir_filter + omega * cf * vi_filter);
        f.dxdt(slot, 3) = (omega_b / cf) * (ii_cnv - ii_filter - omega * cf * vr_filter);
        f.dxdt(slot, 4) = (omega_b / lg) * (vr_filter - v_r - rg * ir_filter + omega * lg * ii_filter);
        f.dxdt(slot, 5) = (omega_b / lg) * (vi_filter - v_i - rg * ii_filter - omega * lg * ir_filter);

        f.current_r += f.base_power_ratio * ir_filter;
        f.current_i += f.base_power_ratio * ii_filter;
    }
};

// =============================================================================
// Model Variants
// =============================================================================

using ConverterModel = std::variant<AverageConverter>;
using OuterControlModel = std::variant<VirtualInertiaQDroop>;
using InnerControlModel = std::variant<VoltageModeControl>;
using DCSourceModel = std::variant<FixedDCSource>;
using FrequencyEstimatorModel = std::variant<KauraPLL>;
using FilterModel = std::variant<LCLFilter>;

}  // namespace powerdyn::v1
