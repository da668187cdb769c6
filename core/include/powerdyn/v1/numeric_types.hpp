#pragma once

// =============================================================================
// powerdyn - Numeric Types Foundation
// =============================================================================
// Shared scalar, index, vector and matrix aliases. The residual evaluator is a
// template over its scalar type; `ADScalar` is the forward-mode automatic
// differentiation scalar used to obtain Jacobians. Its derivative part has a
// fixed chunk width, so constants always carry a (zero) derivative of the same
// shape and a Jacobian is assembled in ceil(n / ad_chunk_size) passes.
// =============================================================================

#include <Eigen/Core>
#include <Eigen/SparseCore>
#include <unsupported/Eigen/AutoDiff>

#include <complex>
#include <cstdint>
#include <numbers>
#include <type_traits>

namespace powerdyn::v1 {

// =============================================================================
// Scalar and Index Types
// =============================================================================

using Real = double;
using Complex = std::complex<Real>;
using Index = std::int32_t;

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using ComplexVector = Eigen::VectorXcd;
using ComplexMatrix = Eigen::MatrixXcd;
using SparseMatrix = Eigen::SparseMatrix<Real, Eigen::ColMajor>;
using ComplexSparseMatrix = Eigen::SparseMatrix<Complex, Eigen::ColMajor>;

/// Number of Jacobian columns seeded per forward AD pass
inline constexpr int ad_chunk_size = 8;

/// Forward-mode AD scalar carrying `ad_chunk_size` directional derivatives
using ADScalar = Eigen::AutoDiffScalar<Eigen::Matrix<Real, ad_chunk_size, 1>>;

inline constexpr Real pi = std::numbers::pi_v<Real>;

// =============================================================================
// Scalar helpers shared by double and AD code paths
// =============================================================================

template<typename T>
struct is_ad_scalar : std::false_type {};

template<typename DerType>
struct is_ad_scalar<Eigen::AutoDiffScalar<DerType>> : std::true_type {};

template<typename T>
inline constexpr bool is_ad_scalar_v = is_ad_scalar<T>::value;

/// Numeric value of a scalar regardless of whether it carries derivatives
template<typename T>
[[nodiscard]] inline Real value_of(const T& x) {
    if constexpr (is_ad_scalar_v<T>) {
        return x.value();
    } else {
        return static_cast<Real>(x);
    }
}

/// Base angular frequency in rad/s for a nominal frequency in Hz
[[nodiscard]] constexpr Real base_angular_frequency(Real frequency_hz) noexcept {
    return 2.0 * pi * frequency_hz;
}

}  // namespace powerdyn::v1
