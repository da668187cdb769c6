#include "powerdyn/v1/small_signal.hpp"

#include "powerdyn/v1/jacobian.hpp"

#include <Eigen/Eigenvalues>
#include <Eigen/LU>

#include <cmath>
#include <sstream>

namespace powerdyn::v1 {

namespace {

Matrix block(const Matrix& jacobian, const std::vector<Index>& rows, const std::vector<Index>& cols) {
    Matrix out(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(cols.size()));
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < cols.size(); ++c) {
            out(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = jacobian(rows[r], cols[c]);
        }
    }
    return out;
}

std::string format_eigenvalues(const ComplexVector& values) {
    std::ostringstream oss;
    oss << "eigenvalues:";
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        oss << "\n  " << values[i].real() << (values[i].imag() < 0.0 ? " - " : " + ")
            << std::abs(values[i].imag()) << "i";
    }
    return oss.str();
}

void record(SmallSignalResult& result, DiagnosticLog& log, DiagnosticSeverity severity,
            DiagnosticCode code, std::string message) {
    result.diagnostics.push_back(log.emit(severity, code, std::move(message)));
}

}  // namespace

bool is_small_signal_stable(const ComplexVector& eigenvalues, Real tolerance) {
    for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
        if (eigenvalues[i].real() > tolerance) {
            return false;
        }
    }
    return true;
}

SmallSignalResult analyze_small_signal(SimulationInputs& inputs,
                                       const Vector& operating_point,
                                       Real time,
                                       DiagnosticLog& log,
                                       const SmallSignalOptions& options) {
    SmallSignalResult result;
    result.operating_point = operating_point;
    result.time = time;

    const Index n = inputs.variable_count();
    if (operating_point.size() != n) {
        std::ostringstream oss;
        oss << "operating point has " << operating_point.size() << " entries, expected " << n;
        result.message = oss.str();
        return result;
    }

    const auto& differential = inputs.differential_vars();
    for (Index i = 0; i < n; ++i) {
        if (differential[static_cast<std::size_t>(i)]) {
            result.differential_states.push_back(i);
        } else {
            result.algebraic_states.push_back(i);
        }
    }

    // Separate AD context: the live simulation's evaluator buffers are untouched
    JacobianEvaluator jacobian_evaluator(inputs);
    Matrix jacobian;
    Vector residual;
    jacobian_evaluator.evaluate(operating_point, Vector::Zero(n), time, jacobian, residual);
    if (!jacobian.allFinite()) {
        result.message = "Jacobian at the operating point is not finite";
        return result;
    }

    const auto& xs = result.differential_states;
    const auto& ys = result.algebraic_states;
    const Matrix fx = block(jacobian, xs, xs);

    if (ys.empty()) {
        result.reduced_jacobian = fx;
    } else {
        const Matrix fy = block(jacobian, xs, ys);
        const Matrix gx = block(jacobian, ys, xs);
        const Matrix gy = block(jacobian, ys, ys);

        Eigen::FullPivLU<Matrix> gy_lu(gy);
        if (!gy_lu.isInvertible()) {
            std::ostringstream oss;
            oss << "algebraic Jacobian gy is singular (rank " << gy_lu.rank() << " of "
                << gy.rows() << "); the reduced Jacobian is undefined";
            result.status = SmallSignalStatus::SingularAlgebraicJacobian;
            result.message = oss.str();
            record(result, log, DiagnosticSeverity::Error,
                   DiagnosticCode::SingularAlgebraicJacobian, result.message);
            return result;
        }
        result.reduced_jacobian = fx - fy * gy_lu.solve(gx);
    }

    if (result.reduced_jacobian.size() == 0) {
        result.status = SmallSignalStatus::Success;
        result.stable = true;
        result.message = "no differential states";
        return result;
    }

    Eigen::EigenSolver<Matrix> eigen(result.reduced_jacobian, true);
    if (eigen.info() != Eigen::Success) {
        result.message = "eigen decomposition of the reduced Jacobian failed";
        record(result, log, DiagnosticSeverity::Error, DiagnosticCode::EigenDecompositionFailed,
               result.message);
        return result;
    }
    result.eigenvalues = eigen.eigenvalues();
    result.eigenvectors = eigen.eigenvectors();

    const Eigen::Index m = result.eigenvalues.size();
    result.damping.resize(m);
    result.frequency.resize(m);
    for (Eigen::Index i = 0; i < m; ++i) {
        const Complex lambda = result.eigenvalues[i];
        const Real magnitude = std::abs(lambda);
        result.damping[i] = magnitude > 0.0 ? -lambda.real() / magnitude : 1.0;
        result.frequency[i] = std::abs(lambda.imag()) / (2.0 * pi);
    }

    Eigen::FullPivLU<ComplexMatrix> right_lu(result.eigenvectors);
    if (right_lu.isInvertible()) {
        const ComplexMatrix left = right_lu.inverse();
        result.participation_factors.resize(m, m);
        for (Eigen::Index mode = 0; mode < m; ++mode) {
            Real total = 0.0;
            for (Eigen::Index k = 0; k < m; ++k) {
                const Real p = std::abs(result.eigenvectors(k, mode) * left(mode, k));
                result.participation_factors(k, mode) = p;
                total += p;
            }
            if (total > 0.0) {
                result.participation_factors.col(mode) /= total;
            }
        }
    } else {
        record(result, log, DiagnosticSeverity::Advisory, DiagnosticCode::EigenDecompositionFailed,
               "eigenvector matrix is singular; participation factors not computed");
    }

    result.stable = is_small_signal_stable(result.eigenvalues, options.stability_tolerance);
    result.status = SmallSignalStatus::Success;
    result.message = result.stable ? "small-signal stable" : "small-signal unstable";

    if (!inputs.has_source()) {
        record(result, log, DiagnosticSeverity::Advisory, DiagnosticCode::NoReferenceSource,
               "no infinite bus found; only a strict check of non-positive real parts was "
               "performed. The system is small-signal stable when all eigenvalues lie in the "
               "left half plane and only one eigenvalue is zero.\n" +
                   format_eigenvalues(result.eigenvalues));
    }
    return result;
}

}  // namespace powerdyn::v1
