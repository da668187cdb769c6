#include <catch2/catch_test_macros.hpp>

#include "powerdyn/v1/simulation_inputs.hpp"
#include "test_systems.hpp"

#include <algorithm>
#include <set>

using namespace powerdyn::v1;

namespace {

ComponentDescriptor descriptor(ComponentKind kind, std::vector<std::string> states,
                               std::vector<std::string> ports = {}) {
    return ComponentDescriptor{kind, to_string(kind), std::move(states), std::move(ports)};
}

}  // namespace

TEST_CASE("v1 device index partitions the local state vector", "[v1][indexing]") {
    DynamicGenerator gen = test::make_classical_generator("g1", 1, 1.0, 0.5);
    gen.machine = OneDOneQMachine{};
    gen.avr = AVRTypeI{};
    gen.tg = TGTypeII{};

    const DeviceIndex index = DeviceIndexBuilder::build(gen.name, DeviceCategory::Generator,
                                                        gen.states(), gen.components(), gen.refs);

    std::vector<Index> covered;
    for (const ComponentKind kind : index.evaluation_order()) {
        const auto& local = index.local_state_ix(kind);
        covered.insert(covered.end(), local.begin(), local.end());
    }
    std::sort(covered.begin(), covered.end());

    REQUIRE(covered.size() == index.states.size());
    for (std::size_t i = 0; i < covered.size(); ++i) {
        CHECK(covered[i] == static_cast<Index>(i));
    }

    // Machine reads delta and omega from the shaft
    const auto& machine_ports = index.input_port_ix(ComponentKind::Machine);
    REQUIRE(machine_ports.size() >= 2);
    CHECK(index.states[static_cast<std::size_t>(machine_ports[0])] == "delta");
    CHECK(index.states[static_cast<std::size_t>(machine_ports[1])] == "omega");
}

TEST_CASE("v1 device index follows the canonical evaluation chain", "[v1][indexing]") {
    const std::vector<ComponentDescriptor> components = {
        descriptor(ComponentKind::Machine, {}),
        descriptor(ComponentKind::Shaft, {"delta", "omega"}),
        descriptor(ComponentKind::TurbineGovernor, {}),
    };
    const DeviceIndex index = DeviceIndexBuilder::build("g", DeviceCategory::Generator,
                                                        {"delta", "omega"}, components, {});

    const std::vector<ComponentKind> expected = {
        ComponentKind::TurbineGovernor, ComponentKind::Machine, ComponentKind::Shaft};
    CHECK(index.evaluation_order() == expected);
    CHECK_FALSE(index.has_component(ComponentKind::AVR));
    CHECK_THROWS_AS(index.slot(ComponentKind::AVR), std::logic_error);
}

TEST_CASE("v1 device index skips ports the device does not declare", "[v1][indexing]") {
    const std::vector<ComponentDescriptor> components = {
        descriptor(ComponentKind::Shaft, {"delta", "omega"}),
        descriptor(ComponentKind::PSS, {}, {"omega", "x_missing", "delta"}),
    };
    const DeviceIndex index = DeviceIndexBuilder::build("g", DeviceCategory::Generator,
                                                        {"delta", "omega"}, components, {});

    const ComponentSlot& pss = index.slot(ComponentKind::PSS);
    REQUIRE(pss.port_ix.size() == 2);
    CHECK(pss.port_ix[0] == 1);
    CHECK(pss.port_ix[1] == 0);
    REQUIRE(pss.port_position.size() == 3);
    CHECK(pss.port_position[0] == 0);
    CHECK(pss.port_position[1] == unresolved_port);
    CHECK(pss.port_position[2] == 1);
}

TEST_CASE("v1 device index rejects malformed devices", "[v1][indexing][validation]") {
    SECTION("component state missing from the device") {
        const std::vector<ComponentDescriptor> components = {
            descriptor(ComponentKind::Shaft, {"delta", "omega"}),
        };
        CHECK_THROWS_AS(DeviceIndexBuilder::build("g", DeviceCategory::Generator, {"delta"},
                                                  components, {}),
                        IndexingError);
    }

    SECTION("state claimed by two components") {
        const std::vector<ComponentDescriptor> components = {
            descriptor(ComponentKind::Shaft, {"delta", "omega"}),
            descriptor(ComponentKind::TurbineGovernor, {"omega"}),
        };
        CHECK_THROWS_AS(DeviceIndexBuilder::build("g", DeviceCategory::Generator,
                                                  {"delta", "omega"}, components, {}),
                        IndexingError);
    }

    SECTION("component outside the category chain") {
        const std::vector<ComponentDescriptor> components = {
            descriptor(ComponentKind::Filter, {}),
        };
        CHECK_THROWS_AS(DeviceIndexBuilder::build("g", DeviceCategory::Generator, {}, components, {}),
                        IndexingError);
    }

    SECTION("duplicate declared state") {
        CHECK_THROWS_AS(DeviceIndexBuilder::build("g", DeviceCategory::Generator,
                                                  {"delta", "delta"}, {}, {}),
                        IndexingError);
    }

    SECTION("overridden state list without a component state") {
        PowerSystem system = test::make_gen_load_system();
        system.generators[0].set_states({"delta"});
        CHECK_THROWS_AS(SimulationInputs(std::make_shared<PowerSystem>(system)), IndexingError);
    }
}

TEST_CASE("v1 simulation inputs lay out the global state vector", "[v1][indexing]") {
    const PowerSystem system = test::make_mixed_system();
    const auto inverter_states = static_cast<Index>(system.inverters[0].states().size());
    SimulationInputs inputs(std::make_shared<PowerSystem>(system));

    const Index n = 3;
    REQUIRE(inputs.bus_count() == n);
    CHECK(inputs.injection_state_count() == 2 + inverter_states);
    CHECK(inputs.branch_state_count() == 2);
    CHECK(inputs.variable_count() == 2 * n + 2 + inverter_states + 2);

    const InjectionIndex* gen = inputs.find_injection("gen");
    const InjectionIndex* inv = inputs.find_injection("inv");
    REQUIRE(gen != nullptr);
    REQUIRE(inv != nullptr);
    CHECK(gen->device.offset == 2 * n);
    CHECK(inv->device.offset == 2 * n + 2);
    CHECK(inv->base_power_ratio == 0.5);
    CHECK(inputs.registry().at("gen", "omega") == 2 * n + 1);
    CHECK(inputs.registry().at("dyn23", "Il_R") == 2 * n + 2 + inverter_states);
    CHECK_THROWS_AS(inputs.registry().at("gen", "psi"), std::out_of_range);

    // Dynamic line terminals carry differential voltages
    const auto& diff = inputs.differential_vars();
    CHECK_FALSE(diff[0]);
    CHECK_FALSE(diff[static_cast<std::size_t>(n)]);
    CHECK(diff[1]);
    CHECK(diff[2]);
    CHECK(diff[static_cast<std::size_t>(n + 1)]);
    CHECK(diff[static_cast<std::size_t>(2 * n)]);

    const auto [vr, vi] = inputs.voltage_index(3);
    CHECK(vr == 2);
    CHECK(vi == 5);
    CHECK_THROWS_AS(inputs.voltage_index(7), BuildError);
}

TEST_CASE("v1 simulation inputs reject inconsistent systems", "[v1][indexing][validation]") {
    SECTION("no buses") {
        CHECK_THROWS_AS(SimulationInputs(std::make_shared<PowerSystem>()), BuildError);
    }

    SECTION("device on an unknown bus") {
        PowerSystem system = test::make_gen_load_system();
        system.generators[0].bus = 9;
        CHECK_THROWS_AS(SimulationInputs(std::make_shared<PowerSystem>(system)), BuildError);
    }

    SECTION("duplicate device names") {
        PowerSystem system = test::make_gen_load_system();
        system.add_generator(test::make_classical_generator("gen", 1, 1.0, 0.1));
        CHECK_THROWS_AS(SimulationInputs(std::make_shared<PowerSystem>(system)), IndexingError);
    }
}

TEST_CASE("v1 flat start seeds voltages and nominal component states", "[v1][indexing]") {
    SimulationInputs inputs(std::make_shared<PowerSystem>(test::make_omib_system()));
    const Vector x0 = inputs.flat_start();

    REQUIRE(x0.size() == inputs.variable_count());
    CHECK(x0[0] == 1.0);
    CHECK(x0[1] == 1.0);
    CHECK(x0[2] == 0.0);
    CHECK(x0[3] == 0.0);
    CHECK(x0[inputs.registry().at("gen", "omega")] == 1.0);
}
