#pragma once

// =============================================================================
// powerdyn - Automatic Differentiation Jacobian
// =============================================================================
// dF/dx of the residual evaluator by forward-mode AD. Each pass seeds
// `ad_chunk_size` state columns, so a Jacobian of n states costs
// ceil(n / ad_chunk_size) residual evaluations. The AD evaluator is its own
// evaluation context and never touches the buffers of a double evaluator.
// =============================================================================

#include "powerdyn/v1/residual.hpp"

#include <vector>

namespace powerdyn::v1 {

class JacobianEvaluator {
public:
    explicit JacobianEvaluator(SimulationInputs& inputs);

    /// Dense Jacobian with respect to x at (dx, x, t); `residual` receives F
    void evaluate(const Vector& x, const Vector& dx, Real t, Matrix& jacobian, Vector& residual);

    /// Same as evaluate(), returned as a compressed sparse matrix
    void evaluate_sparse(const Vector& x, const Vector& dx, Real t,
                         SparseMatrix& jacobian, Vector& residual);

    [[nodiscard]] int passes() const { return passes_; }

private:
    ResidualEvaluator<ADScalar> evaluator_;
    std::vector<ADScalar> x_ad_;
    std::vector<ADScalar> out_ad_;
    Matrix dense_;
    int passes_ = 0;
};

}  // namespace powerdyn::v1
