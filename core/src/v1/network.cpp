#include "powerdyn/v1/network.hpp"

#include <string>

namespace powerdyn::v1 {

namespace {

Index require_bus(const BusLookup& lookup, int number, const std::string& element) {
    const auto it = lookup.find(number);
    if (it == lookup.end()) {
        throw BuildError(element + " references unknown bus " + std::to_string(number));
    }
    return it->second;
}

}  // namespace

void stamp_branch(std::vector<Eigen::Triplet<Complex>>& triplets,
                  Index from, Index to, Complex y_series, Real b_total, Real sign) {
    const Complex y_shunt(0.0, b_total / 2.0);
    triplets.emplace_back(from, from, sign * (y_series + y_shunt));
    triplets.emplace_back(to, to, sign * (y_series + y_shunt));
    triplets.emplace_back(from, to, -sign * y_series);
    triplets.emplace_back(to, from, -sign * y_series);
}

BusLookup make_bus_lookup(const PowerSystem& system) {
    BusLookup lookup;
    for (std::size_t i = 0; i < system.buses.size(); ++i) {
        const int number = system.buses[i].number;
        if (!lookup.emplace(number, static_cast<Index>(i)).second) {
            throw BuildError("duplicate bus number " + std::to_string(number));
        }
    }
    return lookup;
}

ComplexSparseMatrix assemble_ybus(const PowerSystem& system, const BusLookup& lookup) {
    const auto n = static_cast<Index>(system.bus_count());
    ComplexSparseMatrix ybus(n, n);
    if (!system.has_branches()) {
        return ybus;
    }

    std::vector<Eigen::Triplet<Complex>> triplets;
    triplets.reserve(4 * (system.lines.size() + 2 * system.dynamic_lines.size()));

    for (const auto& line : system.lines) {
        const Index f = require_bus(lookup, line.from, "line '" + line.name + "'");
        const Index t = require_bus(lookup, line.to, "line '" + line.name + "'");
        if (!line.available) continue;
        stamp_branch(triplets, f, t, line.series_admittance(), line.b, 1.0);
    }

    // Dynamic lines enter the static matrix and are then removed again
    for (const auto& line : system.dynamic_lines) {
        const Index f = require_bus(lookup, line.from, "dynamic line '" + line.name + "'");
        const Index t = require_bus(lookup, line.to, "dynamic line '" + line.name + "'");
        if (!line.available) continue;
        stamp_branch(triplets, f, t, line.series_admittance(), line.b, 1.0);
    }
    for (const auto& line : system.dynamic_lines) {
        if (!line.available) continue;
        stamp_branch(triplets, lookup.at(line.from), lookup.at(line.to),
                     line.series_admittance(), line.b, -1.0);
    }

    ybus.setFromTriplets(triplets.begin(), triplets.end());
    ybus.prune(Complex(0.0, 0.0));
    ybus.makeCompressed();
    return ybus;
}

Network Network::build(const PowerSystem& system) {
    Network network;
    network.lookup_ = make_bus_lookup(system);
    network.bus_count_ = static_cast<Index>(system.bus_count());
    network.ybus_ = assemble_ybus(system, network.lookup_);

    network.assign_capacitance(system);
    network.voltage_bus_.assign(system.bus_count(), false);
    for (Index i = 0; i < network.bus_count_; ++i) {
        if (network.capacitance_[static_cast<std::size_t>(i)] > 0.0) {
            network.voltage_buses_.push_back(i);
            network.voltage_bus_[static_cast<std::size_t>(i)] = true;
        }
    }
    return network;
}

void Network::rebuild(const PowerSystem& system) {
    ybus_ = assemble_ybus(system, lookup_);
    assign_capacitance(system);
}

void Network::assign_capacitance(const PowerSystem& system) {
    capacitance_.assign(system.bus_count(), 0.0);
    for (const auto& line : system.dynamic_lines) {
        if (!line.available) continue;
        capacitance_[static_cast<std::size_t>(lookup_.at(line.from))] += line.b / 2.0;
        capacitance_[static_cast<std::size_t>(lookup_.at(line.to))] += line.b / 2.0;
    }
}

void Network::set_ybus(ComplexSparseMatrix ybus) {
    if (ybus.rows() != bus_count_ || ybus.cols() != bus_count_) {
        throw std::invalid_argument("admittance matrix must be " + std::to_string(bus_count_) +
                                    "x" + std::to_string(bus_count_));
    }
    ybus.makeCompressed();
    ybus_ = std::move(ybus);
}

std::optional<Index> Network::find_bus(int number) const {
    const auto it = lookup_.find(number);
    if (it == lookup_.end()) return std::nullopt;
    return it->second;
}

Index Network::bus_index(int number) const {
    return require_bus(lookup_, number, "lookup");
}

}  // namespace powerdyn::v1
