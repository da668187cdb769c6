#pragma once

// =============================================================================
// powerdyn - Power System Domain Model
// =============================================================================
// Buses, branches and injections with their static and dynamic parameters.
// All device parameters are on the device base; `PowerSystem::constants`
// carries the system base power and frequency.
// =============================================================================

#include "powerdyn/v1/components/generator_components.hpp"
#include "powerdyn/v1/components/inverter_components.hpp"
#include "powerdyn/v1/device_index.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace powerdyn::v1 {

// =============================================================================
// Network Elements
// =============================================================================

enum class BusType : std::uint8_t {
    REF,
    PV,
    PQ
};

[[nodiscard]] constexpr const char* to_string(BusType type) noexcept {
    switch (type) {
        case BusType::REF: return "REF";
        case BusType::PV: return "PV";
        case BusType::PQ: return "PQ";
    }
    return "unknown";
}

struct Bus {
    int number = 0;
    std::string name;
    Real base_voltage = 230.0;  // kV
    Real magnitude = 1.0;       // steady-state voltage (pu)
    Real angle = 0.0;           // steady-state angle (rad)
    BusType bus_type = BusType::PQ;
};

/// Pi-model transmission line
struct Line {
    std::string name;
    int from = 0;
    int to = 0;
    Real r = 0.0;
    Real x = 0.1;
    Real b = 0.0;  // total shunt susceptance
    bool available = true;

    [[nodiscard]] Complex series_admittance() const { return 1.0 / Complex(r, x); }
};

/// Line whose series current is a state (RL dynamics); its shunt halves
/// turn the terminal buses into voltage buses
struct DynamicLine {
    std::string name;
    int from = 0;
    int to = 0;
    Real r = 0.0;
    Real x = 0.1;
    Real b = 0.0;
    bool available = true;
    std::map<std::string, Real> initial_conditions;  // filled by a successful initialization

    [[nodiscard]] Complex series_admittance() const { return 1.0 / Complex(r, x); }
    [[nodiscard]] static std::vector<std::string> states() { return {"Il_R", "Il_I"}; }
};

// =============================================================================
// Static Injections
// =============================================================================

/// Constant impedance load sized at the bus steady-state voltage
struct PowerLoad {
    std::string name;
    int bus = 0;
    Real P = 0.0;  // pu on system base
    Real Q = 0.0;
    bool available = true;
};

/// Ideal voltage source behind a Thevenin impedance (infinite bus)
struct Source {
    std::string name;
    int bus = 0;
    Real V_ref = 1.0;
    Real theta_ref = 0.0;
    Real R_th = 0.0;
    Real X_th = 1e-4;
    bool available = true;
};

// =============================================================================
// Dynamic Injections
// =============================================================================

struct DynamicGenerator {
    std::string name;
    int bus = 0;
    Real base_power = 100.0;  // MVA
    ControlRefs refs;
    bool available = true;

    MachineModel machine = BaseMachine{};
    ShaftModel shaft = SingleMass{};
    AVRModel avr = AVRFixed{};
    TurbineGovernorModel tg = TGFixed{};
    PSSModel pss = PSSFixed{};

    /// Local state values written back by a successful initialization
    std::map<std::string, Real> initial_conditions;

    /// Sub-component descriptors in device state order (machine, shaft, avr, tg, pss)
    [[nodiscard]] std::vector<ComponentDescriptor> components() const;

    /// Declared local states; the concatenation of component states unless overridden
    [[nodiscard]] std::vector<std::string> states() const;

    /// Nominal value per local state, in `states()` order
    [[nodiscard]] std::vector<Real> initial_guess() const;

    void set_states(std::vector<std::string> states) { state_override_ = std::move(states); }

private:
    std::optional<std::vector<std::string>> state_override_;
};

struct DynamicInverter {
    std::string name;
    int bus = 0;
    Real base_power = 100.0;
    ControlRefs refs;
    bool available = true;

    ConverterModel converter = AverageConverter{};
    OuterControlModel outer_control = VirtualInertiaQDroop{};
    InnerControlModel inner_control = VoltageModeControl{};
    DCSourceModel dc_source = FixedDCSource{};
    FrequencyEstimatorModel freq_estimator = KauraPLL{};
    FilterModel filter = LCLFilter{};

    /// Local state values written back by a successful initialization
    std::map<std::string, Real> initial_conditions;

    /// Sub-component descriptors in device state order
    /// (outer, inner, dc source, frequency estimator, converter, filter)
    [[nodiscard]] std::vector<ComponentDescriptor> components() const;
    [[nodiscard]] std::vector<std::string> states() const;
    [[nodiscard]] std::vector<Real> initial_guess() const;

    void set_states(std::vector<std::string> states) { state_override_ = std::move(states); }

private:
    std::optional<std::vector<std::string>> state_override_;
};

// =============================================================================
// Power System
// =============================================================================

class PowerSystem {
public:
    SystemConstants constants;

    std::vector<Bus> buses;
    std::vector<Line> lines;
    std::vector<DynamicLine> dynamic_lines;
    std::vector<PowerLoad> loads;
    std::vector<Source> sources;
    std::vector<DynamicGenerator> generators;
    std::vector<DynamicInverter> inverters;

    Bus& add_bus(Bus bus) { return buses.emplace_back(std::move(bus)); }
    Line& add_line(Line line) { return lines.emplace_back(std::move(line)); }
    DynamicLine& add_dynamic_line(DynamicLine line) {
        return dynamic_lines.emplace_back(std::move(line));
    }
    PowerLoad& add_load(PowerLoad load) { return loads.emplace_back(std::move(load)); }
    Source& add_source(Source source) { return sources.emplace_back(std::move(source)); }
    DynamicGenerator& add_generator(DynamicGenerator gen) {
        return generators.emplace_back(std::move(gen));
    }
    DynamicInverter& add_inverter(DynamicInverter inv) {
        return inverters.emplace_back(std::move(inv));
    }

    [[nodiscard]] Bus* find_bus(int number);
    [[nodiscard]] Line* find_line(const std::string& name);
    [[nodiscard]] DynamicLine* find_dynamic_line(const std::string& name);
    [[nodiscard]] PowerLoad* find_load(const std::string& name);
    [[nodiscard]] Source* find_source(const std::string& name);
    [[nodiscard]] DynamicGenerator* find_generator(const std::string& name);
    [[nodiscard]] DynamicInverter* find_inverter(const std::string& name);

    [[nodiscard]] std::size_t bus_count() const { return buses.size(); }
    [[nodiscard]] std::size_t dynamic_injection_count() const {
        return generators.size() + inverters.size();
    }
    [[nodiscard]] bool has_branches() const { return !lines.empty() || !dynamic_lines.empty(); }
};

}  // namespace powerdyn::v1
