#include "powerdyn/v1/initialization.hpp"

#include "powerdyn/v1/jacobian.hpp"

#include <sstream>

namespace powerdyn::v1 {

InitializationResult initialize_state(SimulationInputs& inputs,
                                      const Vector& guess,
                                      const InitializationOptions& options) {
    InitializationResult result;
    const Index n = inputs.variable_count();
    if (guess.size() != n) {
        std::ostringstream oss;
        oss << "initial guess has " << guess.size() << " entries, expected " << n;
        result.state = guess;
        result.message = oss.str();
        return result;
    }

    ResidualEvaluator<Real> residual(inputs);
    JacobianEvaluator jacobian(inputs);
    const Vector dx = Vector::Zero(n);
    const Real t0 = options.time;

    NewtonOptions newton_options = options.newton;
    newton_options.num_voltage_vars = 2 * inputs.bus_count();
    NewtonRaphsonSolver<> newton(newton_options);

    auto system = [&](const Vector& x, Vector& f, SparseMatrix& J, bool need_jacobian) {
        if (need_jacobian) {
            jacobian.evaluate_sparse(x, dx, t0, J, f);
            return;
        }
        f.resize(n);
        residual.evaluate(std::span<Real>(f.data(), static_cast<std::size_t>(n)),
                          std::span<const Real>(dx.data(), static_cast<std::size_t>(n)),
                          std::span<const Real>(x.data(), static_cast<std::size_t>(n)), t0);
    };

    const NewtonResult newton_result = newton.solve(guess, system);

    result.state = newton_result.solution;
    result.status = newton_result.status;
    result.iterations = newton_result.iterations;
    result.residual_norm = newton_result.final_residual;
    result.history = newton_result.history;
    result.success = newton_result.success();
    if (result.success) {
        std::ostringstream oss;
        oss << "converged in " << result.iterations << " iterations (|F| = "
            << result.residual_norm << ")";
        result.message = oss.str();
    } else {
        std::ostringstream oss;
        oss << "no consistent initial state after " << result.iterations << " iterations: "
            << to_string(result.status);
        if (!newton_result.error_message.empty()) {
            oss << " (" << newton_result.error_message << ")";
        }
        result.message = oss.str();
    }
    return result;
}

}  // namespace powerdyn::v1
