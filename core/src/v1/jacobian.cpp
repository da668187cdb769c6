#include "powerdyn/v1/jacobian.hpp"

#include <algorithm>

namespace powerdyn::v1 {

JacobianEvaluator::JacobianEvaluator(SimulationInputs& inputs)
    : evaluator_(inputs),
      x_ad_(static_cast<std::size_t>(inputs.variable_count()), ADScalar(0.0)),
      out_ad_(static_cast<std::size_t>(inputs.variable_count()), ADScalar(0.0)) {}

void JacobianEvaluator::evaluate(const Vector& x, const Vector& dx, Real t,
                                 Matrix& jacobian, Vector& residual) {
    const auto n = static_cast<Index>(x_ad_.size());
    jacobian.setZero(n, n);
    residual.resize(n);
    passes_ = 0;
    if (n == 0) {
        return;
    }

    const std::span<const Real> dx_span(dx.data(), static_cast<std::size_t>(dx.size()));

    for (Index first = 0; first < n; first += ad_chunk_size) {
        const Index width = std::min<Index>(ad_chunk_size, n - first);
        for (Index i = 0; i < n; ++i) {
            const auto k = static_cast<std::size_t>(i);
            if (i >= first && i < first + width) {
                x_ad_[k] = ADScalar(x[i], ad_chunk_size, i - first);
            } else {
                x_ad_[k] = ADScalar(x[i]);
            }
        }

        evaluator_.evaluate(std::span<ADScalar>(out_ad_), dx_span,
                            std::span<const ADScalar>(x_ad_), t);
        ++passes_;

        for (Index r = 0; r < n; ++r) {
            const ADScalar& value = out_ad_[static_cast<std::size_t>(r)];
            for (Index c = 0; c < width; ++c) {
                jacobian(r, first + c) = value.derivatives()[c];
            }
            if (first == 0) {
                residual[r] = value.value();
            }
        }
    }
}

void JacobianEvaluator::evaluate_sparse(const Vector& x, const Vector& dx, Real t,
                                        SparseMatrix& jacobian, Vector& residual) {
    evaluate(x, dx, t, dense_, residual);
    jacobian = dense_.sparseView(0.0, 0.0);
    jacobian.makeCompressed();
}

}  // namespace powerdyn::v1
