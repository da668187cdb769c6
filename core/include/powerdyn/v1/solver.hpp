#pragma once

// =============================================================================
// powerdyn - Newton Solver and Linear Solver Policies
// =============================================================================
// Damped Newton-Raphson used for consistent initialization and for the
// implicit stage of the native DAE integrator:
// - Weighted norm over bus voltages and device states
// - Convergence history tracking
// - Policy-based design for linear solvers (Eigen SparseLU by default)
// =============================================================================

#include "powerdyn/v1/numeric_types.hpp"

#include <Eigen/SparseLU>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace powerdyn::v1 {

// =============================================================================
// Solver Status and Result Types
// =============================================================================

enum class SolverStatus {
    Success,
    MaxIterationsReached,
    SingularMatrix,
    NumericalError,
    Diverging
};

[[nodiscard]] constexpr const char* to_string(SolverStatus status) noexcept {
    switch (status) {
        case SolverStatus::Success: return "Success";
        case SolverStatus::MaxIterationsReached: return "MaxIterationsReached";
        case SolverStatus::SingularMatrix: return "SingularMatrix";
        case SolverStatus::NumericalError: return "NumericalError";
        case SolverStatus::Diverging: return "Diverging";
        default: return "Unknown";
    }
}

// =============================================================================
// Convergence History Tracking
// =============================================================================

struct IterationRecord {
    int iteration = 0;
    Real residual_norm = 0.0;
    Real step_norm = 0.0;
    Real damping = 1.0;
};

class ConvergenceHistory {
public:
    static constexpr std::size_t max_history = 100;

    void add_record(const IterationRecord& record) {
        if (records_.size() < max_history) {
            records_.push_back(record);
        }
    }

    void set_final_status(SolverStatus status) { final_status_ = status; }

    [[nodiscard]] std::size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }
    [[nodiscard]] const IterationRecord& operator[](std::size_t i) const { return records_[i]; }
    [[nodiscard]] const IterationRecord& last() const { return records_.back(); }
    [[nodiscard]] SolverStatus final_status() const { return final_status_; }

    [[nodiscard]] auto begin() const { return records_.begin(); }
    [[nodiscard]] auto end() const { return records_.end(); }

private:
    std::vector<IterationRecord> records_;
    SolverStatus final_status_ = SolverStatus::Success;
};

// =============================================================================
// Weighted Norm Convergence Checker
// =============================================================================

class ConvergenceChecker {
public:
    struct Tolerances {
        Real voltage_abstol = 1e-8;   // bus voltage components (pu)
        Real state_abstol = 1e-8;     // device and branch states
        Real reltol = 1e-6;
        Real residual_tol = 1e-8;
    };

    ConvergenceChecker() = default;
    explicit ConvergenceChecker(const Tolerances& tol) : tol_(tol) {}

    /// Maximum normalized update error (converged if <= 1.0). The leading
    /// `num_voltage_vars` entries are bus voltage components.
    [[nodiscard]] Real check_weighted_norm(const Vector& delta, const Vector& solution,
                                           Index num_voltage_vars) const {
        Real max_error = 0.0;
        for (Index i = 0; i < delta.size(); ++i) {
            const Real abstol = i < num_voltage_vars ? tol_.voltage_abstol : tol_.state_abstol;
            const Real tol = abstol + tol_.reltol * std::abs(solution[i]);
            max_error = std::max(max_error, std::abs(delta[i]) / tol);
        }
        return max_error;
    }

    [[nodiscard]] bool check_residual(const Vector& f) const {
        return f.lpNorm<Eigen::Infinity>() < tol_.residual_tol;
    }

    [[nodiscard]] const Tolerances& tolerances() const { return tol_; }

private:
    Tolerances tol_;
};

// =============================================================================
// Linear Solver Result Type
// =============================================================================

struct LinearSolveResult {
    std::optional<Vector> solution;
    std::string error;

    [[nodiscard]] bool has_value() const { return solution.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }
    [[nodiscard]] const Vector& value() const { return *solution; }
    [[nodiscard]] const Vector& operator*() const { return *solution; }

    static LinearSolveResult success(Vector v) { return {std::move(v), {}}; }
    static LinearSolveResult failure(std::string err) { return {std::nullopt, std::move(err)}; }
};

// =============================================================================
// Linear Solver Policy Concept
// =============================================================================

template<typename T>
concept LinearSolverPolicy = requires(T solver, const SparseMatrix& A, const Vector& b) {
    { solver.analyze(A) } -> std::same_as<bool>;
    { solver.factorize(A) } -> std::same_as<bool>;
    { solver.solve(b) } -> std::same_as<LinearSolveResult>;
    { solver.is_singular() } -> std::same_as<bool>;
};

// =============================================================================
// SparseLU Linear Solver Policy
// =============================================================================

class SparseLUPolicy {
public:
    bool analyze(const SparseMatrix& A) {
        solver_.analyzePattern(A);
        analyzed_ = true;
        return true;
    }

    bool factorize(const SparseMatrix& A) {
        if (!analyzed_) analyze(A);
        solver_.factorize(A);
        singular_ = (solver_.info() != Eigen::Success);
        factorized_ = !singular_;
        return factorized_;
    }

    [[nodiscard]] LinearSolveResult solve(const Vector& b) {
        if (!factorized_) {
            return LinearSolveResult::failure("Matrix not factorized");
        }
        Vector x = solver_.solve(b);
        if (solver_.info() != Eigen::Success || !x.allFinite()) {
            return LinearSolveResult::failure("Linear solve failed");
        }
        return LinearSolveResult::success(std::move(x));
    }

    [[nodiscard]] bool is_singular() const { return singular_; }

private:
    Eigen::SparseLU<SparseMatrix> solver_;
    bool analyzed_ = false;
    bool factorized_ = false;
    bool singular_ = false;
};

static_assert(LinearSolverPolicy<SparseLUPolicy>);

// =============================================================================
// Newton Solver Result and Options
// =============================================================================

struct NewtonResult {
    Vector solution;
    SolverStatus status = SolverStatus::NumericalError;
    int iterations = 0;
    Real final_residual = 0.0;
    Real final_weighted_error = 0.0;
    int line_search_backtracks = 0;
    ConvergenceHistory history;
    std::string error_message;

    [[nodiscard]] bool success() const { return status == SolverStatus::Success; }
};

struct NewtonOptions {
    int max_iterations = 50;
    Real initial_damping = 1.0;
    Real min_damping = 0.01;
    bool auto_damping = true;
    bool track_history = true;
    bool reuse_jacobian_pattern = false;  // only when the sparsity pattern is fixed
    Index num_voltage_vars = 0;  // leading bus voltage entries, for the weighted norm
    ConvergenceChecker::Tolerances tolerances;
};

// =============================================================================
// Newton-Raphson Solver
// =============================================================================

template<LinearSolverPolicy LinearPolicy = SparseLUPolicy>
class NewtonRaphsonSolver {
public:
    /// Evaluates F(x) into `f`; fills `J` with dF/dx when `need_jacobian` is set
    using SystemFunction =
        std::function<void(const Vector& x, Vector& f, SparseMatrix& J, bool need_jacobian)>;

    explicit NewtonRaphsonSolver(const NewtonOptions& opts = {})
        : options_(opts), convergence_checker_(opts.tolerances) {}

    /// Solve F(x) = 0
    [[nodiscard]] NewtonResult solve(const Vector& x0, const SystemFunction& system_func) {
        NewtonResult result;
        result.solution = x0;

        const Index n = static_cast<Index>(x0.size());
        Vector f(n);
        SparseMatrix J(n, n);
        Vector dx(n);

        Real damping = options_.initial_damping;
        Real prev_residual = std::numeric_limits<Real>::max();
        bool pattern_analyzed = false;

        for (int iter = 0; iter < options_.max_iterations; ++iter) {
            system_func(result.solution, f, J, true);

            if (!f.allFinite()) {
                return finish(result, SolverStatus::NumericalError,
                              "Residual is not finite", iter + 1);
            }

            const Real f_norm = f.norm();
            result.final_residual = f_norm;

            if (f_norm > 1e6 * prev_residual && iter > 3) {
                return finish(result, SolverStatus::Diverging,
                              "Newton iteration diverging", iter + 1);
            }
            prev_residual = f_norm;

            if (!options_.reuse_jacobian_pattern || !pattern_analyzed) {
                linear_solver_.analyze(J);
                pattern_analyzed = true;
            }

            // Solve J * dx = -f
            if (!linear_solver_.factorize(J)) {
                return finish(result, SolverStatus::SingularMatrix,
                              "Jacobian is singular", iter + 1);
            }
            auto solve_result = linear_solver_.solve(-f);
            if (!solve_result) {
                return finish(result, SolverStatus::NumericalError, solve_result.error, iter + 1);
            }
            dx = *solve_result;

            Real step_damping = damping;
            if (options_.auto_damping) {
                const LineSearchResult ls = line_search(result.solution, dx, f_norm,
                                                        system_func, damping);
                step_damping = ls.damping;
                result.line_search_backtracks += ls.backtracks;
                // Gradually restore damping
                damping = std::min(step_damping * 1.5, options_.initial_damping);
            }

            dx *= step_damping;
            result.solution += dx;

            if (options_.track_history) {
                IterationRecord record;
                record.iteration = iter;
                record.residual_norm = f_norm;
                record.step_norm = dx.norm();
                record.damping = step_damping;
                result.history.add_record(record);
            }

            const Real weighted_error = convergence_checker_.check_weighted_norm(
                dx, result.solution, options_.num_voltage_vars);
            result.final_weighted_error = weighted_error;

            if (weighted_error <= 1.0) {
                system_func(result.solution, f, J, false);
                result.final_residual = f.norm();
                if (convergence_checker_.check_residual(f)) {
                    return finish(result, SolverStatus::Success, {}, iter + 1);
                }
            }
        }

        system_func(result.solution, f, J, false);
        result.final_residual = f.norm();
        if (convergence_checker_.check_residual(f)) {
            return finish(result, SolverStatus::Success, {}, options_.max_iterations);
        }
        return finish(result, SolverStatus::MaxIterationsReached,
                      "Max iterations reached", options_.max_iterations);
    }

private:
    NewtonOptions options_;
    LinearPolicy linear_solver_;
    ConvergenceChecker convergence_checker_;

    struct LineSearchResult {
        Real damping = 1.0;
        int backtracks = 0;
    };

    static NewtonResult& finish(NewtonResult& result, SolverStatus status,
                                std::string message, int iterations) {
        result.status = status;
        result.error_message = std::move(message);
        result.iterations = iterations;
        result.history.set_final_status(status);
        return result;
    }

    /// Simple backtracking line search
    LineSearchResult line_search(const Vector& x, const Vector& dx, Real f_norm,
                                 const SystemFunction& system_func, Real initial_damping) {
        Real damping = initial_damping;
        const Index n = static_cast<Index>(x.size());
        Vector x_new = x + dx * damping;
        Vector f_new(n);
        SparseMatrix J_unused(n, n);

        system_func(x_new, f_new, J_unused, false);
        Real f_new_norm = f_new.allFinite() ? f_new.norm() : std::numeric_limits<Real>::infinity();

        constexpr int max_backtracks = 10;
        int bt = 0;
        while (f_new_norm > f_norm && damping > options_.min_damping && bt < max_backtracks) {
            damping *= 0.5;
            x_new = x + dx * damping;
            system_func(x_new, f_new, J_unused, false);
            f_new_norm = f_new.allFinite() ? f_new.norm() : std::numeric_limits<Real>::infinity();
            ++bt;
        }

        LineSearchResult result;
        result.damping = damping;
        result.backtracks = bt;
        return result;
    }
};

}  // namespace powerdyn::v1
