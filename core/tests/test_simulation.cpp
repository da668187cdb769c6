#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "powerdyn/v1/simulation.hpp"
#include "test_systems.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace powerdyn::v1;
using Catch::Approx;

namespace {

namespace fs = std::filesystem;

/// Scratch directory removed on scope exit
class ScratchFolder {
public:
    explicit ScratchFolder(const std::string& name)
        : path_(fs::temp_directory_path() / ("powerdyn_" + name)) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~ScratchFolder() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    ScratchFolder(const ScratchFolder&) = delete;
    ScratchFolder& operator=(const ScratchFolder&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

SimulationOptions step_options() {
    SimulationOptions options;
    options.tspan = {0.0, 6.0};
    return options;
}

bool has_code(const std::vector<Diagnostic>& diagnostics, DiagnosticCode code) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [code](const Diagnostic& d) { return d.code == code; });
}

}  // namespace

TEST_CASE("v1 simulation build validates its inputs", "[v1][simulation][validation]") {
    SECTION("tspan must be increasing") {
        SimulationOptions options;
        options.tspan = {1.0, 1.0};
        CHECK_THROWS_AS(Simulation::build(test::make_omib_system(), {}, options), BuildError);
    }

    SECTION("initial guess must match the state size") {
        SimulationOptions options;
        options.initial_guess = Vector::Zero(3);
        CHECK_THROWS_AS(Simulation::build(test::make_omib_system(), {}, options), BuildError);
    }

    SECTION("simulation folder must exist") {
        SimulationOptions options;
        options.simulation_folder = fs::temp_directory_path() / "powerdyn_missing_folder_xyz";
        CHECK_THROWS_AS(Simulation::build(test::make_omib_system(), {}, options), BuildError);
    }

    SECTION("perturbation target must exist") {
        CHECK_THROWS_AS(Simulation::build(test::make_omib_system(), {LoadTrip{1.0, "ghost"}}),
                        BuildError);
    }

    SECTION("malformed device") {
        PowerSystem system = test::make_omib_system();
        system.generators[0].set_states({"delta", "omega", "delta"});
        CHECK_THROWS_AS(Simulation::build(system), IndexingError);
    }
}

TEST_CASE("v1 simulation initializes to a consistent operating point", "[v1][simulation]") {
    Simulation sim = Simulation::build(test::make_omib_system());

    REQUIRE(sim.initialized());
    CHECK(sim.stage() == SimulationStage::Initialized);
    CHECK(sim.initialization().success);
    CHECK(sim.initialization().residual_norm < 1e-6);
    REQUIRE_FALSE(sim.initialization().history.empty());
    CHECK(sim.initialization().history.final_status() == SolverStatus::Success);

    const SimulationInputs& inputs = sim.inputs();
    CHECK(sim.x0_init()[inputs.registry().at("gen", "delta")] ==
          Approx(test::omib_rotor_angle(0.5)).margin(1e-6));
    CHECK(sim.x0_init()[inputs.registry().at("gen", "omega")] == Approx(1.0).margin(1e-10));
    CHECK(sim.tstops() == std::vector<Real>{0.0});
    CHECK(sim.callbacks().empty());
    CHECK_FALSE(sim.has_solution());
    CHECK_THROWS_AS(sim.solution(), std::logic_error);
}

TEST_CASE("v1 simulation without perturbations stays at equilibrium", "[v1][simulation]") {
    SimulationOptions options;
    options.tspan = {0.0, 2.0};
    Simulation sim = Simulation::build(test::make_omib_system(), {}, options);

    const SimulationRunResult result = sim.run();
    REQUIRE(result.success());
    CHECK(result.perturbations_applied.empty());
    CHECK_FALSE(sim.requires_reset());
    CHECK(sim.stage() == SimulationStage::Integrated);

    const TimeSeries omega = sim.state_series("gen", "omega");
    REQUIRE(omega.time.size() > 2);
    CHECK(omega.time.back() == 2.0);
    for (const Real w : omega.values) {
        CHECK(w == Approx(1.0).margin(1e-6));
    }

    const TimeSeries v2 = sim.voltage_series(2);
    CHECK(v2.values.size() == omega.values.size());
    CHECK(v2.values.front() == Approx(v2.values.back()).margin(1e-6));

    CHECK_THROWS_AS(sim.state_series("gen", "psi_d"), std::out_of_range);
    CHECK_THROWS_AS(sim.voltage_series(42), BuildError);

    // A run without perturbations leaves the instance reusable
    CHECK(sim.run().success());
}

TEST_CASE("v1 simulation applies a control step exactly at its trigger time", "[v1][simulation][events]") {
    const std::vector<Perturbation> perturbations = {
        ControlReferenceChange{5.0, "gen", ControlReference::ActivePowerRef, 0.6}};
    Simulation sim = Simulation::build(test::make_omib_system(), perturbations, step_options());

    CHECK(sim.tstops() == std::vector<Real>{5.0});
    REQUIRE(sim.callbacks().size() == 1);

    const SimulationRunResult result = sim.run();
    REQUIRE(result.success());
    REQUIRE(result.perturbations_applied.size() == 1);
    CHECK(result.statistics.events == 1);
    CHECK(has_code(sim.diagnostics(), DiagnosticCode::PerturbationApplied));
    CHECK(sim.callbacks()[0].state() == CallbackState::Fired);

    const TimeSeries omega = sim.state_series("gen", "omega");
    CHECK(std::count(omega.time.begin(), omega.time.end(), 5.0) >= 1);

    Real before = 0.0;
    Real after = 0.0;
    for (std::size_t i = 0; i < omega.time.size(); ++i) {
        const Real deviation = std::abs(omega.values[i] - 1.0);
        if (omega.time[i] < 5.0) {
            before = std::max(before, deviation);
        } else if (omega.time[i] > 5.0) {
            after = std::max(after, deviation);
        }
    }
    CHECK(before < 1e-5);
    CHECK(after > 1e-4);

    // Rotor angle swings towards the new operating point
    const TimeSeries delta = sim.state_series("gen", "delta");
    CHECK(delta.values.back() > test::omib_rotor_angle(0.5));

    // Applied perturbations invalidate the instance
    CHECK(sim.requires_reset());
    const SimulationRunResult again = sim.run();
    CHECK(again.status == SimulationStatus::ResetRequired);
    CHECK(again.message == "Reset the simulation");
    CHECK(sim.small_signal_analysis().status == SmallSignalStatus::SimulationReset);
}

TEST_CASE("v1 simulation reset flag can be raised explicitly", "[v1][simulation]") {
    Simulation sim = Simulation::build(test::make_omib_system());
    sim.mark_reset();

    CHECK(sim.run().status == SimulationStatus::ResetRequired);
    CHECK(has_code(sim.diagnostics(), DiagnosticCode::ResetRequired));
    CHECK_FALSE(sim.has_solution());
}

TEST_CASE("v1 simulation reports failed initialization and keeps the guess", "[v1][simulation]") {
    SimulationOptions options;
    options.initialization.newton.max_iterations = 1;
    options.initialization.newton.auto_damping = false;

    Simulation sim = Simulation::build(test::make_omib_system(), {}, options);
    CHECK_FALSE(sim.initialized());
    CHECK(sim.stage() == SimulationStage::Built);
    CHECK(has_code(sim.diagnostics(), DiagnosticCode::InitializationFailed));
    CHECK((sim.x0_init().array() == sim.inputs().flat_start().array()).all());

    // A second attempt with the default budget converges
    SimulationOptions retry;
    Simulation fresh = Simulation::build(test::make_omib_system(), {}, retry);
    CHECK(fresh.initialized());
}

TEST_CASE("v1 simulation snapshots the system to the simulation folder", "[v1][simulation][io]") {
    ScratchFolder folder("snapshot");

    SimulationOptions options;
    options.system_to_file = true;
    options.simulation_folder = folder.path();

    SECTION("input snapshot on build") {
        Simulation sim = Simulation::build(test::make_omib_system(), {}, options);
        const fs::path file = folder.path() / "input_system.json";
        REQUIRE(fs::exists(file));

        std::ifstream in(file);
        const nlohmann::json j = nlohmann::json::parse(in);
        CHECK(j["buses"].size() == 2);
        CHECK(j["generators"][0]["name"] == "gen");
        CHECK(j["generators"][0]["machine"]["type"] == "BaseMachine");
    }

    SECTION("initialized snapshot on in-place build") {
        auto system = std::make_shared<PowerSystem>(test::make_omib_system());
        Simulation sim = Simulation::build_in_place(system, {}, options);
        REQUIRE(sim.initialized());
        const fs::path file = folder.path() / "initialized_system.json";
        REQUIRE(fs::exists(file));
        CHECK(has_code(sim.diagnostics(), DiagnosticCode::SnapshotWritten));

        // The snapshot carries the solved operating point, not the input
        const Vector& x0 = sim.x0_init();
        const auto [vr, vi] = sim.inputs().voltage_index(2);
        const Real angle = std::atan2(x0[vi], x0[vr]);
        REQUIRE(std::abs(angle) > 1e-3);
        CHECK(system->buses[1].angle == Approx(angle));

        std::ifstream in(file);
        const nlohmann::json j = nlohmann::json::parse(in);
        CHECK(j["buses"][1]["angle"].get<double>() == Approx(angle));
        CHECK(j["buses"][1]["magnitude"].get<double>() == Approx(std::hypot(x0[vr], x0[vi])));
        const Index delta = sim.inputs().registry().at("gen", "delta");
        CHECK(j["generators"][0]["initial_conditions"]["delta"].get<double>() == Approx(x0[delta]));
        CHECK(j["generators"][0]["initial_conditions"]["omega"].get<double>() == Approx(1.0));
    }
}

TEST_CASE("v1 in-place simulation mutates the caller's system", "[v1][simulation]") {
    auto system = std::make_shared<PowerSystem>(test::make_omib_system());
    system->add_load(PowerLoad{"load2", 2, 0.1, 0.0, true});

    SimulationOptions options;
    options.tspan = {0.0, 1.0};
    Simulation sim = Simulation::build_in_place(system, {LoadChange{0.5, "load2", LoadVariable::P, 0.2}},
                                                options);
    REQUIRE(sim.run().success());
    CHECK(system->loads[0].P == 0.2);

    // A copied build leaves the original untouched
    PowerSystem original = test::make_omib_system();
    original.add_load(PowerLoad{"load2", 2, 0.1, 0.0, true});
    Simulation copy = Simulation::build(original, {LoadTrip{0.5, "load2"}}, options);
    REQUIRE(copy.run().success());
    CHECK(original.loads[0].available);
    CHECK_FALSE(copy.inputs().system().loads[0].available);
}
