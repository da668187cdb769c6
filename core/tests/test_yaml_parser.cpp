#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "powerdyn/v1/parser/yaml_parser.hpp"

#include <algorithm>
#include <string>
#include <variant>

using namespace powerdyn::v1;
using namespace powerdyn::v1::parser;
using Catch::Approx;

namespace {

bool contains_code(const std::vector<std::string>& messages, const std::string& code) {
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& m) {
        return m.find("[" + code + "]") != std::string::npos;
    });
}

const std::string kMinimalHeader = R"(
schema: powerdyn-v1
version: 1
)";

}  // namespace

TEST_CASE("v1 YAML parser loads a complete case file", "[v1][yaml]") {
    YamlParser parser;
    const SimulationCase sim_case = parser.load(std::string(POWERDYN_TEST_DATA_DIR) + "/omib_step.yaml");

    INFO((parser.errors().empty() ? std::string() : parser.errors().front()));
    REQUIRE(parser.ok());

    const PowerSystem& system = sim_case.system;
    REQUIRE(system.buses.size() == 2);
    CHECK(system.buses[0].bus_type == BusType::REF);
    CHECK(system.buses[1].name == "gen_bus");
    REQUIRE(system.lines.size() == 1);
    CHECK(system.lines[0].x == Approx(0.1));
    REQUIRE(system.sources.size() == 1);
    CHECK(system.sources[0].X_th == Approx(1e-4));

    REQUIRE(system.generators.size() == 1);
    const DynamicGenerator& gen = system.generators[0];
    CHECK(gen.refs.p_ref == Approx(0.5));
    REQUIRE(std::holds_alternative<BaseMachine>(gen.machine));
    CHECK(std::get<BaseMachine>(gen.machine).Xd_p == Approx(0.2));
    REQUIRE(std::holds_alternative<SingleMass>(gen.shaft));
    CHECK(std::get<SingleMass>(gen.shaft).H == Approx(3.0));
    CHECK(std::get<SingleMass>(gen.shaft).D == Approx(2.0));

    REQUIRE(sim_case.perturbations.size() == 1);
    const auto* step = std::get_if<ControlReferenceChange>(&sim_case.perturbations[0]);
    REQUIRE(step != nullptr);
    CHECK(step->time == 5.0);
    CHECK(step->device == "gen");
    CHECK(step->signal == ControlReference::ActivePowerRef);
    CHECK(step->value == Approx(0.6));

    CHECK(sim_case.options.tspan.first == 0.0);
    CHECK(sim_case.options.tspan.second == 6.0);
    CHECK(sim_case.options.backend == DaeBackend::NativeBdf);
    CHECK(sim_case.options.small_signal.stability_tolerance == Approx(1e-6));
}

TEST_CASE("v1 YAML parser reports a missing file", "[v1][yaml]") {
    YamlParser parser;
    (void)parser.load("/nonexistent/powerdyn_case.yaml");
    CHECK_FALSE(parser.ok());
    CHECK(parser.errors().front().find("Cannot open file") != std::string::npos);
}

TEST_CASE("v1 YAML parser validates the schema header", "[v1][yaml][validation]") {
    YamlParser parser;

    (void)parser.load_string("version: 1\nsystem: {buses: [{number: 1}]}\n");
    CHECK_FALSE(parser.ok());

    (void)parser.load_string("schema: other\nversion: 1\nsystem: {buses: [{number: 1}]}\n");
    CHECK_FALSE(parser.ok());

    (void)parser.load_string("schema: powerdyn-v1\nversion: 2\nsystem: {buses: [{number: 1}]}\n");
    CHECK_FALSE(parser.ok());

    (void)parser.load_string("schema: [unterminated\n");
    CHECK_FALSE(parser.ok());
}

TEST_CASE("v1 YAML parser strict mode rejects unknown fields", "[v1][yaml][validation]") {
    const std::string content = kMinimalHeader + R"(
system:
  buses:
    - {number: 1, colour: red}
)";

    YamlParser strict;
    (void)strict.load_string(content);
    CHECK_FALSE(strict.ok());
    CHECK(contains_code(strict.errors(), "POWERDYN_YAML_E_UNKNOWN_FIELD"));

    YamlParser lenient(YamlParserOptions{false});
    const SimulationCase sim_case = lenient.load_string(content);
    CHECK(lenient.ok());
    CHECK(contains_code(lenient.warnings(), "POWERDYN_YAML_W_FIELD_IGNORED"));
    CHECK(sim_case.system.buses.size() == 1);
}

TEST_CASE("v1 YAML parser rejects unsupported component types", "[v1][yaml][validation]") {
    const std::string content = kMinimalHeader + R"(
system:
  buses: [{number: 1}]
  generators:
    - name: g
      bus: 1
      machine: {type: SixthOrderMachine}
)";

    YamlParser parser;
    (void)parser.load_string(content);
    CHECK_FALSE(parser.ok());
    CHECK(contains_code(parser.errors(), "POWERDYN_YAML_E_COMPONENT_UNSUPPORTED"));
}

TEST_CASE("v1 YAML parser defaults omitted components with a warning", "[v1][yaml]") {
    const std::string content = kMinimalHeader + R"(
system:
  buses: [{number: 1}]
  generators:
    - name: g
      bus: 1
      machine: {type: OneDOneQMachine, Xd: 1.5}
)";

    YamlParser parser;
    const SimulationCase sim_case = parser.load_string(content);
    REQUIRE(parser.ok());
    CHECK(contains_code(parser.warnings(), "POWERDYN_YAML_W_COMPONENT_DEFAULT"));

    const DynamicGenerator& gen = sim_case.system.generators.at(0);
    REQUIRE(std::holds_alternative<OneDOneQMachine>(gen.machine));
    CHECK(std::get<OneDOneQMachine>(gen.machine).Xd == Approx(1.5));
    CHECK(std::holds_alternative<SingleMass>(gen.shaft));
    CHECK(std::holds_alternative<AVRFixed>(gen.avr));
}

TEST_CASE("v1 YAML parser reports type mismatches and missing fields", "[v1][yaml][validation]") {
    const std::string content = kMinimalHeader + R"(
system:
  buses:
    - {number: one}
    - {name: nameless}
  loads:
    - {name: l1, bus: 1, P: heavy}
)";

    YamlParser parser;
    (void)parser.load_string(content);
    CHECK_FALSE(parser.ok());
    CHECK(contains_code(parser.errors(), "POWERDYN_YAML_E_TYPE_MISMATCH"));
    CHECK(contains_code(parser.errors(), "POWERDYN_YAML_E_MISSING_FIELD"));
}

TEST_CASE("v1 YAML parser reads every perturbation type", "[v1][yaml]") {
    const std::string content = kMinimalHeader + R"(
system:
  buses: [{number: 1}, {number: 2}]
  lines: [{name: l12, from: 1, to: 2, x: 0.1}]
  loads: [{name: ld, bus: 2, P: 0.1}]
  sources: [{name: inf, bus: 1}]
perturbations:
  - {type: BranchTrip, time: 1.0, branch: l12}
  - {type: BranchImpedanceChange, time: 1.0, branch: l12, multiplier: 2.0}
  - type: NetworkSwitch
    time: 2.0
    ybus:
      - {from: 1, to: 1, g: 0.0, b: -10.0}
      - {from: 2, to: 2, g: 0.0, b: -10.0}
  - {type: LoadChange, time: 3.0, load: ld, variable: Q, value: 0.2}
  - {type: LoadTrip, time: 3.5, load: ld}
  - {type: SourceBusVoltageChange, time: 4.0, source: inf, variable: theta_ref, value: 0.1}
  - {type: GeneratorTrip, time: 5.0, device: g}
simulation:
  tspan: [0.0, 10.0]
  solver: ida
  initial_guess: [1.0, 1.0, 0.0, 0.0]
)";

    YamlParser parser;
    const SimulationCase sim_case = parser.load_string(content);
    INFO((parser.errors().empty() ? std::string() : parser.errors().front()));
    REQUIRE(parser.ok());
    REQUIRE(sim_case.perturbations.size() == 7);

    CHECK(std::holds_alternative<BranchTrip>(sim_case.perturbations[0]));
    CHECK(std::get<BranchImpedanceChange>(sim_case.perturbations[1]).multiplier == 2.0);

    const auto& sw = std::get<NetworkSwitch>(sim_case.perturbations[2]);
    REQUIRE(sw.ybus.rows() == 2);
    CHECK(sw.ybus.coeff(1, 1) == Complex(0.0, -10.0));

    CHECK(std::get<LoadChange>(sim_case.perturbations[3]).variable == LoadVariable::Q);
    CHECK(std::get<LoadTrip>(sim_case.perturbations[4]).load == "ld");
    CHECK(std::get<SourceBusVoltageChange>(sim_case.perturbations[5]).variable == SourceVariable::Angle);
    CHECK(std::get<GeneratorTrip>(sim_case.perturbations[6]).device == "g");

    CHECK(sim_case.options.backend == DaeBackend::Ida);
    REQUIRE(sim_case.options.initial_guess.has_value());
    CHECK(sim_case.options.initial_guess->size() == 4);
}

TEST_CASE("v1 YAML parser rejects unknown perturbations and bad options", "[v1][yaml][validation]") {
    const std::string content = kMinimalHeader + R"(
system:
  buses: [{number: 1}]
perturbations:
  - {type: Earthquake, time: 1.0}
simulation:
  tspan: [2.0, 1.0]
  solver: euler
)";

    YamlParser parser;
    (void)parser.load_string(content);
    CHECK_FALSE(parser.ok());
    CHECK(contains_code(parser.errors(), "POWERDYN_YAML_E_PERTURBATION_UNSUPPORTED"));
    CHECK(contains_code(parser.errors(), "POWERDYN_YAML_E_PARAM_INVALID"));
}
