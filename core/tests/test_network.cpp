#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "powerdyn/v1/network.hpp"
#include "test_systems.hpp"

using namespace powerdyn::v1;
using Catch::Approx;

namespace {

PowerSystem make_two_bus_system() {
    PowerSystem system;
    system.add_bus(Bus{10, "a"});
    system.add_bus(Bus{20, "b"});
    Line line;
    line.name = "ab";
    line.from = 10;
    line.to = 20;
    line.r = 0.0;
    line.x = 0.5;
    line.b = 0.2;
    system.add_line(line);
    return system;
}

}  // namespace

TEST_CASE("v1 network stamps pi-model lines", "[v1][network]") {
    const PowerSystem system = make_two_bus_system();
    const Network network = Network::build(system);

    REQUIRE(network.bus_count() == 2);
    // y_series = 1 / j0.5 = -j2, shunt half = j0.1
    CHECK(network.admittance(0, 0).real() == Approx(0.0).margin(1e-12));
    CHECK(network.admittance(0, 0).imag() == Approx(-1.9));
    CHECK(network.admittance(1, 1).imag() == Approx(-1.9));
    CHECK(network.admittance(0, 1).imag() == Approx(2.0));
    CHECK(network.admittance(1, 0).imag() == Approx(2.0));
    CHECK(network.voltage_buses().empty());
}

TEST_CASE("v1 network maps bus numbers in declaration order", "[v1][network]") {
    const Network network = Network::build(make_two_bus_system());

    CHECK(network.bus_index(10) == 0);
    CHECK(network.bus_index(20) == 1);
    CHECK_FALSE(network.find_bus(30).has_value());
    CHECK_THROWS_AS(network.bus_index(30), BuildError);
}

TEST_CASE("v1 network without branches has an all-zero admittance matrix", "[v1][network]") {
    PowerSystem system;
    system.add_bus(Bus{1, "a"});
    system.add_bus(Bus{2, "b"});
    system.add_bus(Bus{3, "c"});

    const Network network = Network::build(system);
    REQUIRE(network.ybus().rows() == 3);
    REQUIRE(network.ybus().cols() == 3);
    CHECK(network.ybus().nonZeros() == 0);
}

TEST_CASE("v1 network removes dynamic lines from the static matrix", "[v1][network]") {
    PowerSystem system = make_two_bus_system();
    system.lines.clear();
    DynamicLine line;
    line.name = "ab_dyn";
    line.from = 10;
    line.to = 20;
    line.x = 0.5;
    line.b = 0.2;
    system.add_dynamic_line(line);

    const Network network = Network::build(system);
    CHECK(std::abs(network.admittance(0, 0)) == Approx(0.0).margin(1e-12));
    CHECK(std::abs(network.admittance(0, 1)) == Approx(0.0).margin(1e-12));

    // Shunt halves become bus capacitances
    REQUIRE(network.voltage_buses().size() == 2);
    CHECK(network.capacitance(0) == Approx(0.1));
    CHECK(network.capacitance(1) == Approx(0.1));

    // Out of service: capacitance drops, the buses keep their differential rows
    Network rebuilt = network;
    system.dynamic_lines[0].available = false;
    rebuilt.rebuild(system);
    CHECK(rebuilt.capacitance(0) == 0.0);
    CHECK(rebuilt.capacitance(1) == 0.0);
    CHECK(rebuilt.voltage_buses().size() == 2);
    CHECK(rebuilt.is_voltage_bus(0));
    CHECK(rebuilt.row_capacitance(0) == min_bus_capacitance);
}

TEST_CASE("v1 network skips unavailable branches", "[v1][network]") {
    PowerSystem system = make_two_bus_system();
    system.lines[0].available = false;

    const Network network = Network::build(system);
    CHECK(network.ybus().nonZeros() == 0);
}

TEST_CASE("v1 network rebuild and replacement", "[v1][network]") {
    PowerSystem system = make_two_bus_system();
    Network network = Network::build(system);

    system.lines[0].x = 0.25;
    network.rebuild(system);
    CHECK(network.admittance(0, 1).imag() == Approx(4.0));

    ComplexSparseMatrix wrong(3, 3);
    CHECK_THROWS_AS(network.set_ybus(wrong), std::invalid_argument);

    ComplexSparseMatrix replacement(2, 2);
    replacement.insert(0, 0) = Complex(1.0, -1.0);
    network.set_ybus(replacement);
    CHECK(network.admittance(0, 0) == Complex(1.0, -1.0));
    CHECK(network.admittance(0, 1) == Complex(0.0, 0.0));
}

TEST_CASE("v1 network rejects unknown and duplicate buses", "[v1][network][validation]") {
    SECTION("branch to unknown bus") {
        PowerSystem system = make_two_bus_system();
        system.lines[0].to = 99;
        CHECK_THROWS_AS(Network::build(system), BuildError);
    }

    SECTION("duplicate bus number") {
        PowerSystem system = make_two_bus_system();
        system.add_bus(Bus{10, "dup"});
        CHECK_THROWS_AS(Network::build(system), BuildError);
    }
}
