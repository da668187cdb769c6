#pragma once

// =============================================================================
// powerdyn - Integration Coefficients and Timestep Control
// =============================================================================
// - Variable-step BDF1/BDF2 coefficients for the implicit DAE stepper
// - Local error estimate from the predictor/corrector difference
// - PI timestep controller with rejection handling and stop-time landing
// =============================================================================

#include "powerdyn/v1/numeric_types.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace powerdyn::v1 {

// =============================================================================
// Variable-Step BDF Coefficients
// =============================================================================

/// dx_{n+1} = (alpha[0] x_{n+1} + alpha[1] x_n + alpha[2] x_{n-1}) / h
struct BDFCoeffs {
    std::array<Real, 3> alpha{};
    int order = 1;

    /// BDF1 (backward Euler)
    [[nodiscard]] static constexpr BDFCoeffs bdf1() noexcept {
        BDFCoeffs c;
        c.alpha = {1.0, -1.0, 0.0};
        c.order = 1;
        return c;
    }

    /// BDF2 on a non-uniform grid, ratio = h / h_prev
    [[nodiscard]] static constexpr BDFCoeffs bdf2(Real ratio) noexcept {
        BDFCoeffs c;
        const Real w = ratio;
        c.alpha = {(1.0 + 2.0 * w) / (1.0 + w), -(1.0 + w), (w * w) / (1.0 + w)};
        c.order = 2;
        return c;
    }

    /// Error constant used to scale the predictor/corrector difference
    [[nodiscard]] constexpr Real error_constant() const noexcept {
        return order == 1 ? 0.5 : 2.0 / 9.0;
    }
};

// =============================================================================
// Local Error Estimate
// =============================================================================

/// Weighted max norm of the local error over differential states.
/// Converged steps with a value <= 1.0 are accepted.
[[nodiscard]] inline Real weighted_local_error(const Vector& x_new,
                                               const Vector& x_pred,
                                               const std::vector<bool>& differential,
                                               Real error_constant,
                                               Real abstol,
                                               Real reltol) {
    Real worst = 0.0;
    for (Eigen::Index i = 0; i < x_new.size(); ++i) {
        if (!differential[static_cast<std::size_t>(i)]) continue;
        const Real scale = abstol + reltol * std::abs(x_new[i]);
        worst = std::max(worst, error_constant * std::abs(x_new[i] - x_pred[i]) / scale);
    }
    return worst;
}

// =============================================================================
// Adaptive Timestep Controller
// =============================================================================

struct TimestepConfig {
    Real dt_min = 1e-10;         // s
    Real dt_max = 0.05;          // s
    Real dt_initial = 1e-4;      // s
    Real safety_factor = 0.9;
    Real growth_factor = 2.0;    // maximum growth per step
    Real shrink_factor = 0.5;    // shrink on rejection
    int max_rejections = 12;     // consecutive rejections before failure

    // PI controller gains
    Real k_p = 0.075;
    Real k_i = 0.175;
};

struct TimestepDecision {
    Real dt_new = 0.0;
    bool accepted = true;
    bool at_minimum = false;
    int rejections = 0;
    Real error_ratio = 0.0;
};

class PITimestepController {
public:
    explicit PITimestepController(const TimestepConfig& config = {})
        : config_(config), dt_current_(config.dt_initial) {}

    /// Decide on a step whose normalized local error is `error_ratio`
    [[nodiscard]] TimestepDecision compute(Real error_ratio, int order) {
        TimestepDecision result;
        result.error_ratio = error_ratio;
        result.accepted = error_ratio <= 1.0;

        if (result.accepted) {
            rejections_ = 0;
            const Real exp_i = config_.k_i / (order + 1.0);
            const Real exp_p = config_.k_p / (order + 1.0);
            Real factor = config_.safety_factor;
            if (error_ratio > 1e-10) {
                factor *= std::pow(1.0 / error_ratio, exp_i);
                if (error_prev_ > 1e-10) {
                    factor *= std::pow(error_prev_ / error_ratio, exp_p);
                }
            } else {
                factor *= config_.growth_factor;
            }
            factor = std::min(factor, config_.growth_factor);
            result.dt_new = dt_current_ * factor;
            error_prev_ = error_ratio;
        } else {
            ++rejections_;
            result.rejections = rejections_;
            result.dt_new = dt_current_ * config_.shrink_factor;
            if (rejections_ > 3) {
                result.dt_new *= config_.shrink_factor;
            }
        }

        if (result.dt_new < config_.dt_min) {
            result.dt_new = config_.dt_min;
            result.at_minimum = true;
        }
        result.dt_new = std::min(result.dt_new, config_.dt_max);
        if (!result.accepted) {
            dt_current_ = result.dt_new;
        }
        return result;
    }

    /// Shrink after a nonlinear solve failure
    TimestepDecision reject_nonconvergence() {
        ++rejections_;
        TimestepDecision result;
        result.accepted = false;
        result.rejections = rejections_;
        result.dt_new = std::max(dt_current_ * 0.25, config_.dt_min);
        result.at_minimum = result.dt_new <= config_.dt_min;
        dt_current_ = result.dt_new;
        return result;
    }

    void accept(Real dt) { dt_current_ = std::clamp(dt, config_.dt_min, config_.dt_max); }

    /// Restart from the initial step (after a discontinuity)
    void restart() {
        dt_current_ = config_.dt_initial;
        error_prev_ = 0.0;
        rejections_ = 0;
    }

    /// Shorten the proposed step so that it lands exactly on `t_stop`
    [[nodiscard]] static Real clip_to_stop(Real t, Real dt, Real t_stop, Real dt_min) {
        const Real remaining = t_stop - t;
        if (dt >= remaining) return remaining;
        // Avoid leaving a sliver shorter than dt_min before the stop
        if (remaining - dt < dt_min) return remaining;
        return dt;
    }

    [[nodiscard]] Real current_dt() const { return dt_current_; }
    [[nodiscard]] int rejections() const { return rejections_; }
    [[nodiscard]] bool failed() const { return rejections_ > config_.max_rejections; }
    [[nodiscard]] const TimestepConfig& config() const { return config_; }

private:
    TimestepConfig config_;
    Real dt_current_;
    Real error_prev_ = 0.0;
    int rejections_ = 0;
};

}  // namespace powerdyn::v1
