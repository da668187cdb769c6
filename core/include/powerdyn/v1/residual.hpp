#pragma once

// =============================================================================
// powerdyn - Residual Evaluator
// =============================================================================
// F(dx, x, t) for the implicit DAE
//
//   out[k] = f_k(x) - dx[k]   for differential states
//   out[k] = g_k(x)           for algebraic states (bus current balance)
//
// One evaluator instance is one evaluation context: it owns its auxiliary
// buffers (bus injections, device ODE outputs, inner variables) and must not
// be shared between concurrent callers. The scalar type is a template
// parameter so the identical code path serves double and forward-mode AD.
// =============================================================================

#include "powerdyn/v1/simulation_inputs.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace powerdyn::v1 {

template<typename T>
class ResidualEvaluator {
public:
    explicit ResidualEvaluator(SimulationInputs& inputs) : inputs_(&inputs) { allocate(); }

    /// Evaluate the residual. `out` and `x` have variable_count entries.
    void evaluate(std::span<T> out, std::span<const Real> dx, std::span<const T> x, Real t) {
        (void)t;  // the model is autonomous; time only matters to the integrator
        const auto n = static_cast<std::size_t>(inputs_->bus_count());
        if (out.size() != static_cast<std::size_t>(inputs_->variable_count()) ||
            x.size() != out.size() || dx.size() != out.size()) {
            throw std::invalid_argument("residual evaluation with mismatched vector sizes");
        }

        reset_buffers();

        const std::span<const T> v_r = x.subspan(0, n);
        const std::span<const T> v_i = x.subspan(n, n);

        accumulate_loads(v_r, v_i);
        accumulate_sources(v_r, v_i);
        evaluate_injections(x, v_r, v_i);
        evaluate_branches(x, v_r, v_i);
        compute_current_balance(v_r, v_i);

        // Bus rows
        const Network& network = inputs_->network();
        const Real omega_b = inputs_->system().constants.omega_base();
        const Real omega_sys = inputs_->system().constants.omega_sys;
        for (std::size_t b = 0; b < n; ++b) {
            if (network.is_voltage_bus(static_cast<Index>(b))) {
                const Real c = network.row_capacitance(static_cast<Index>(b));
                out[b] = (omega_b / c) * (i_balance_[b] + omega_sys * c * v_i[b]) - dx[b];
                out[b + n] = (omega_b / c) * (i_balance_[b + n] - omega_sys * c * v_r[b]) - dx[b + n];
            } else {
                out[b] = i_balance_[b];
                out[b + n] = i_balance_[b + n];
            }
        }

        // Injection and branch rows
        const std::size_t inj0 = 2 * n;
        for (std::size_t k = 0; k < injection_ode_.size(); ++k) {
            out[inj0 + k] = injection_ode_[k] - dx[inj0 + k];
        }
        const std::size_t br0 = inj0 + injection_ode_.size();
        for (std::size_t k = 0; k < branch_ode_.size(); ++k) {
            out[br0 + k] = branch_ode_[k] - dx[br0 + k];
        }

        // Keep this call's inner variables for the next one
        for (std::size_t d = 0; d < inner_.size(); ++d) {
            inner_snapshot_[d] = inner_[d];
        }
    }

    /// Inner-variable buffer of the most recent call for injection `device`
    [[nodiscard]] const std::vector<T>& inner_variables(std::size_t device) const {
        return inner_snapshot_[device];
    }

private:
    SimulationInputs* inputs_;

    std::vector<T> i_injection_r_;
    std::vector<T> i_injection_i_;
    std::vector<T> injection_ode_;
    std::vector<T> branch_ode_;
    std::vector<T> i_network_r_;
    std::vector<T> i_network_i_;
    std::vector<T> i_balance_;
    std::vector<std::vector<T>> inner_;
    std::vector<std::vector<T>> inner_snapshot_;

    void allocate() {
        const auto n = static_cast<std::size_t>(inputs_->bus_count());
        const T zero(0.0);
        i_injection_r_.assign(n, zero);
        i_injection_i_.assign(n, zero);
        i_network_r_.assign(n, zero);
        i_network_i_.assign(n, zero);
        i_balance_.assign(2 * n, zero);
        injection_ode_.assign(static_cast<std::size_t>(inputs_->injection_state_count()), zero);
        branch_ode_.assign(static_cast<std::size_t>(inputs_->branch_state_count()), zero);
        inner_.clear();
        inner_snapshot_.clear();
        for (const auto& entry : inputs_->injections()) {
            inner_.emplace_back(entry.device.inner_size(), zero);
            inner_snapshot_.emplace_back(entry.device.inner_size(), zero);
        }
    }

    void reset_buffers() {
        const T zero(0.0);
        std::fill(i_injection_r_.begin(), i_injection_r_.end(), zero);
        std::fill(i_injection_i_.begin(), i_injection_i_.end(), zero);
        std::fill(injection_ode_.begin(), injection_ode_.end(), zero);
        std::fill(branch_ode_.begin(), branch_ode_.end(), zero);
        // Inner variables start from the previous call's values
        for (std::size_t d = 0; d < inner_.size(); ++d) {
            for (std::size_t k = 0; k < inner_[d].size(); ++k) {
                inner_[d][k] = T(value_of(inner_snapshot_[d][k]));
            }
        }
    }

    void accumulate_loads(std::span<const T> v_r, std::span<const T> v_i) {
        const PowerSystem& system = inputs_->system();
        for (const LoadIndex& entry : inputs_->loads()) {
            const PowerLoad& load = system.loads[entry.model_ix];
            if (!load.available) continue;
            const auto b = static_cast<std::size_t>(entry.bus);
            i_injection_r_[b] -= entry.inv_v0_sq * (load.P * v_r[b] + load.Q * v_i[b]);
            i_injection_i_[b] -= entry.inv_v0_sq * (load.P * v_i[b] - load.Q * v_r[b]);
        }
    }

    void accumulate_sources(std::span<const T> v_r, std::span<const T> v_i) {
        using std::cos;
        using std::sin;
        const PowerSystem& system = inputs_->system();
        for (const SourceIndex& entry : inputs_->sources()) {
            const Source& source = system.sources[entry.model_ix];
            if (!source.available) continue;
            const auto b = static_cast<std::size_t>(entry.bus);
            const Real e_r = source.V_ref * cos(source.theta_ref);
            const Real e_i = source.V_ref * sin(source.theta_ref);
            const Real den = source.R_th * source.R_th + source.X_th * source.X_th;
            const T dv_r = e_r - v_r[b];
            const T dv_i = e_i - v_i[b];
            i_injection_r_[b] += (source.R_th * dv_r + source.X_th * dv_i) / den;
            i_injection_i_[b] += (source.R_th * dv_i - source.X_th * dv_r) / den;
        }
    }

    void evaluate_injections(std::span<const T> x, std::span<const T> v_r, std::span<const T> v_i) {
        PowerSystem& system = inputs_->system();
        const SystemConstants& constants = system.constants;
        const auto inj0 = static_cast<std::size_t>(2 * inputs_->bus_count());
        auto& injections = inputs_->injections();

        for (std::size_t d = 0; d < injections.size(); ++d) {
            const InjectionIndex& entry = injections[d];
            const DeviceIndex& device = entry.device;
            const auto b = static_cast<std::size_t>(entry.bus);
            const auto first = static_cast<std::size_t>(device.offset);
            const auto size = static_cast<std::size_t>(device.size());
            std::vector<T>& inner = inner_[d];

            const bool available = device.category == DeviceCategory::Generator
                ? system.generators[entry.model_ix].available
                : system.inverters[entry.model_ix].available;
            if (!available) {
                continue;  // frozen states, no injection
            }

            // Terminal voltage enters the inner-variable channel first
            if (device.category == DeviceCategory::Generator) {
                inner[generator_var::v_r] = v_r[b];
                inner[generator_var::v_i] = v_i[b];
            } else {
                inner[inverter_var::v_r] = v_r[b];
                inner[inverter_var::v_i] = v_i[b];
            }

            DeviceFrame<T> frame{
                x.subspan(first, size),
                std::span<T>(injection_ode_).subspan(first - inj0, size),
                std::span<T>(inner),
                device.refs,
                constants,
                entry.base_power_ratio,
                i_injection_r_[b],
                i_injection_i_[b],
            };

            for (const ComponentKind kind : device.evaluation_order()) {
                const ComponentSlot& slot = device.slot(kind);
                if (device.category == DeviceCategory::Generator) {
                    evaluate_generator_component(system.generators[entry.model_ix], slot, frame);
                } else {
                    evaluate_inverter_component(system.inverters[entry.model_ix], slot, frame);
                }
            }
        }
    }

    static void evaluate_generator_component(const DynamicGenerator& gen, const ComponentSlot& slot,
                                             DeviceFrame<T>& frame) {
        const auto run = [&](const auto& model) { model.ode(slot, frame); };
        switch (slot.kind) {
            case ComponentKind::TurbineGovernor: std::visit(run, gen.tg); return;
            case ComponentKind::PSS: std::visit(run, gen.pss); return;
            case ComponentKind::AVR: std::visit(run, gen.avr); return;
            case ComponentKind::Machine: std::visit(run, gen.machine); return;
            case ComponentKind::Shaft: std::visit(run, gen.shaft); return;
            default: break;
        }
        throw std::logic_error(std::string("generator '") + gen.name + "' cannot evaluate " +
                               to_string(slot.kind));
    }

    static void evaluate_inverter_component(const DynamicInverter& inv, const ComponentSlot& slot,
                                            DeviceFrame<T>& frame) {
        const auto run = [&](const auto& model) { model.ode(slot, frame); };
        switch (slot.kind) {
            case ComponentKind::DCSource: std::visit(run, inv.dc_source); return;
            case ComponentKind::FrequencyEstimator: std::visit(run, inv.freq_estimator); return;
            case ComponentKind::OuterControl: std::visit(run, inv.outer_control); return;
            case ComponentKind::InnerControl: std::visit(run, inv.inner_control); return;
            case ComponentKind::Converter: std::visit(run, inv.converter); return;
            case ComponentKind::Filter: std::visit(run, inv.filter); return;
            default: break;
        }
        throw std::logic_error(std::string("inverter '") + inv.name + "' cannot evaluate " +
                               to_string(slot.kind));
    }

    void evaluate_branches(std::span<const T> x, std::span<const T> v_r, std::span<const T> v_i) {
        const PowerSystem& system = inputs_->system();
        const Real omega_b = system.constants.omega_base();
        const Real omega_sys = system.constants.omega_sys;
        const auto br0 = static_cast<std::size_t>(2 * inputs_->bus_count() +
                                                  inputs_->injection_state_count());

        for (const auto& entry : inputs_->branches()) {
            const DynamicLine& line = system.dynamic_lines[entry.model_ix];
            if (!line.available) continue;
            const auto k = static_cast<std::size_t>(entry.offset);
            const auto f = static_cast<std::size_t>(entry.from);
            const auto t = static_cast<std::size_t>(entry.to);
            const T& il_r = x[k];
            const T& il_i = x[k + 1];

            branch_ode_[k - br0] =
                (omega_b / line.x) * ((v_r[f] - v_r[t]) - line.r * il_r + omega_sys * line.x * il_i);
            branch_ode_[k + 1 - br0] =
                (omega_b / line.x) * ((v_i[f] - v_i[t]) - line.r * il_i - omega_sys * line.x * il_r);

            i_injection_r_[f] -= il_r;
            i_injection_i_[f] -= il_i;
            i_injection_r_[t] += il_r;
            i_injection_i_[t] += il_i;
        }
    }

    /// I_balance = I_injection - Ybus * V, split into real and imaginary halves
    void compute_current_balance(std::span<const T> v_r, std::span<const T> v_i) {
        const auto n = static_cast<std::size_t>(inputs_->bus_count());
        const T zero(0.0);
        std::fill(i_network_r_.begin(), i_network_r_.end(), zero);
        std::fill(i_network_i_.begin(), i_network_i_.end(), zero);

        const ComplexSparseMatrix& ybus = inputs_->network().ybus();
        for (Eigen::Index col = 0; col < ybus.outerSize(); ++col) {
            const auto j = static_cast<std::size_t>(col);
            for (ComplexSparseMatrix::InnerIterator it(ybus, col); it; ++it) {
                const auto i = static_cast<std::size_t>(it.row());
                const Real g = it.value().real();
                const Real bb = it.value().imag();
                i_network_r_[i] += g * v_r[j] - bb * v_i[j];
                i_network_i_[i] += g * v_i[j] + bb * v_r[j];
            }
        }

        for (std::size_t b = 0; b < n; ++b) {
            i_balance_[b] = i_injection_r_[b] - i_network_r_[b];
            i_balance_[b + n] = i_injection_i_[b] - i_network_i_[b];
        }
    }
};

}  // namespace powerdyn::v1
