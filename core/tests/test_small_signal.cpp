#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "powerdyn/v1/simulation.hpp"
#include "test_systems.hpp"

#include <algorithm>
#include <cmath>

using namespace powerdyn::v1;
using Catch::Approx;

namespace {

SimulationOptions gen_load_options() {
    SimulationOptions options;
    options.initialize = false;
    options.initial_guess = test::gen_load_operating_point();
    return options;
}

bool has_code(const std::vector<Diagnostic>& diagnostics, DiagnosticCode code) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [code](const Diagnostic& d) { return d.code == code; });
}

}  // namespace

TEST_CASE("v1 stability predicate uses the real-part tolerance", "[v1][small_signal]") {
    ComplexVector eigs(3);
    eigs << Complex(-1.0, 2.0), Complex(-1.0, -2.0), Complex(5e-7, 0.0);
    CHECK(is_small_signal_stable(eigs, 1e-6));
    CHECK_FALSE(is_small_signal_stable(eigs, 1e-7));

    eigs[2] = Complex(0.1, 0.0);
    CHECK_FALSE(is_small_signal_stable(eigs, 1e-6));
}

TEST_CASE("v1 small-signal analysis without a reference source", "[v1][small_signal]") {
    Simulation sim = Simulation::build(test::make_gen_load_system(), {}, gen_load_options());
    CHECK_FALSE(sim.initialized());

    const SmallSignalResult result = sim.small_signal_analysis();
    REQUIRE(result.success());
    REQUIRE(result.reduced_jacobian.rows() == 2);
    REQUIRE(result.reduced_jacobian.cols() == 2);
    CHECK(result.differential_states == std::vector<Index>{2, 3});
    CHECK(result.algebraic_states == std::vector<Index>{0, 1});
    CHECK(result.time == 0.0);

    // Rotational mode at zero, speed mode at -D / 2H
    std::vector<Real> real_parts;
    for (Eigen::Index i = 0; i < result.eigenvalues.size(); ++i) {
        CHECK(result.eigenvalues[i].imag() == Approx(0.0).margin(1e-9));
        real_parts.push_back(result.eigenvalues[i].real());
    }
    std::sort(real_parts.begin(), real_parts.end());
    CHECK(real_parts[0] == Approx(-1.0 / 3.0).margin(1e-8));
    CHECK(real_parts[1] == Approx(0.0).margin(1e-8));
    CHECK(result.stable);

    // Advisory lists the eigenvalues
    REQUIRE(has_code(result.diagnostics, DiagnosticCode::NoReferenceSource));
    const auto it = std::find_if(result.diagnostics.begin(), result.diagnostics.end(),
                                 [](const Diagnostic& d) {
                                     return d.code == DiagnosticCode::NoReferenceSource;
                                 });
    CHECK(it->severity == DiagnosticSeverity::Advisory);
    CHECK(it->message.find("only one eigenvalue is zero") != std::string::npos);
    CHECK(has_code(sim.diagnostics(), DiagnosticCode::NoReferenceSource));

    REQUIRE(sim.last_small_signal().has_value());
    CHECK(sim.last_small_signal()->stable);
}

TEST_CASE("v1 small-signal analysis of a machine against an infinite bus", "[v1][small_signal]") {
    Simulation sim = Simulation::build(test::make_omib_system());
    REQUIRE(sim.initialized());

    const Index delta = sim.inputs().registry().at("gen", "delta");
    CHECK(sim.x0_init()[delta] == Approx(test::omib_rotor_angle(0.5)).margin(1e-6));

    const SmallSignalResult result = sim.small_signal_analysis();
    REQUIRE(result.success());
    REQUIRE(result.eigenvalues.size() == 2);
    CHECK(result.stable);
    CHECK_FALSE(has_code(result.diagnostics, DiagnosticCode::NoReferenceSource));

    // Electromechanical pair: -D/4H +- j sqrt(omega_b Ks / 2H - (D/4H)^2)
    const Real omega_b = 2.0 * pi * 60.0;
    const Real ks = std::cos(test::omib_rotor_angle(0.5)) / 0.3001;
    const Real sigma = -2.0 / 12.0;
    const Real omega_d = std::sqrt(omega_b * ks / 6.0 - sigma * sigma);
    for (Eigen::Index i = 0; i < 2; ++i) {
        CHECK(result.eigenvalues[i].real() == Approx(sigma).epsilon(1e-4));
        CHECK(std::abs(result.eigenvalues[i].imag()) == Approx(omega_d).epsilon(1e-4));
        CHECK(result.frequency[i] == Approx(omega_d / (2.0 * pi)).epsilon(1e-4));
        CHECK(result.damping[i] == Approx(-sigma / std::hypot(sigma, omega_d)).epsilon(1e-4));
    }

    // Both states participate in the swing mode and each column sums to one
    REQUIRE(result.participation_factors.rows() == 2);
    for (Eigen::Index mode = 0; mode < 2; ++mode) {
        CHECK(result.participation_factors.col(mode).sum() == Approx(1.0));
        CHECK(result.participation_factors(0, mode) == Approx(0.5).margin(1e-3));
    }
}

TEST_CASE("v1 small-signal analysis reports a singular algebraic jacobian", "[v1][small_signal]") {
    PowerSystem system = test::make_gen_load_system();
    system.add_bus(Bus{2, "isolated"});

    SimulationOptions options;
    std::vector<Diagnostic> seen;
    options.diagnostic_callback = [&seen](const Diagnostic& d) { seen.push_back(d); };

    Simulation sim = Simulation::build(system, {}, options);
    CHECK_FALSE(sim.initialized());
    CHECK(has_code(seen, DiagnosticCode::InitializationFailed));

    const SmallSignalResult result = sim.small_signal_analysis();
    CHECK_FALSE(result.success());
    CHECK(result.status == SmallSignalStatus::SingularAlgebraicJacobian);
    CHECK(result.reduced_jacobian.size() == 0);
    CHECK(result.eigenvalues.size() == 0);
    CHECK(has_code(result.diagnostics, DiagnosticCode::SingularAlgebraicJacobian));
    CHECK(has_code(seen, DiagnosticCode::SingularAlgebraicJacobian));
}

TEST_CASE("v1 small-signal analysis at an explicit operating point", "[v1][small_signal]") {
    Simulation sim = Simulation::build(test::make_gen_load_system(), {}, gen_load_options());

    const SmallSignalResult wrong = sim.small_signal_analysis(Vector::Zero(3));
    CHECK_FALSE(wrong.success());

    const SmallSignalResult result = sim.small_signal_analysis(test::gen_load_operating_point());
    CHECK(result.success());
    CHECK(result.operating_point.size() == 4);
}
