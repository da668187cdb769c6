#pragma once

// =============================================================================
// powerdyn - Network Assembly
// =============================================================================
// Complex bus admittance matrix. Every available branch is stamped with its
// pi model; dynamic lines are then stamped again with sign -1 because their
// series current is integrated as explicit states and their shunt charging is
// carried by the voltage-bus capacitances.
// =============================================================================

#include "powerdyn/v1/system.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <vector>

namespace powerdyn::v1 {

using BusLookup = std::map<int, Index>;

/// Capacitance kept on a voltage bus whose dynamic lines are all out of service.
/// The bus keeps its differential row, which then tracks the current balance.
inline constexpr Real min_bus_capacitance = 1e-6;

/// Add the pi model of a branch between rows `from` and `to`, scaled by `sign`
void stamp_branch(std::vector<Eigen::Triplet<Complex>>& triplets,
                  Index from, Index to, Complex y_series, Real b_total, Real sign);

/// Bus number -> row lookup in declaration order; throws BuildError on duplicates
[[nodiscard]] BusLookup make_bus_lookup(const PowerSystem& system);

/// Ybus of all available branches, corrected for dynamic lines.
/// A system without branches yields an all-zero matrix of bus_count size.
[[nodiscard]] ComplexSparseMatrix assemble_ybus(const PowerSystem& system, const BusLookup& lookup);

class Network {
public:
    /// Throws BuildError when a branch references an unknown bus
    [[nodiscard]] static Network build(const PowerSystem& system);

    /// Reassemble the admittance matrix and the bus capacitances after a branch
    /// changed. The set of voltage buses stays as built.
    void rebuild(const PowerSystem& system);

    /// Replace the admittance matrix outright; dimensions must match
    void set_ybus(ComplexSparseMatrix ybus);

    [[nodiscard]] Index bus_count() const { return bus_count_; }
    [[nodiscard]] const ComplexSparseMatrix& ybus() const { return ybus_; }
    [[nodiscard]] Complex admittance(Index i, Index j) const { return ybus_.coeff(i, j); }

    [[nodiscard]] std::optional<Index> find_bus(int number) const;
    [[nodiscard]] Index bus_index(int number) const;  // throws BuildError
    [[nodiscard]] const BusLookup& lookup() const { return lookup_; }

    /// Buses carrying a shunt capacitance from a dynamic line (differential voltage rows)
    [[nodiscard]] const std::vector<Index>& voltage_buses() const { return voltage_buses_; }
    [[nodiscard]] bool is_voltage_bus(Index bus) const { return voltage_bus_[static_cast<std::size_t>(bus)]; }
    /// Shunt capacitance of the available dynamic lines at `bus`
    [[nodiscard]] Real capacitance(Index bus) const { return capacitance_[static_cast<std::size_t>(bus)]; }
    /// Capacitance used in the differential row of a voltage bus
    [[nodiscard]] Real row_capacitance(Index bus) const {
        return std::max(capacitance(bus), min_bus_capacitance);
    }

private:
    Index bus_count_ = 0;
    ComplexSparseMatrix ybus_;
    BusLookup lookup_;
    std::vector<Index> voltage_buses_;
    std::vector<bool> voltage_bus_;
    std::vector<Real> capacitance_;

    void assign_capacitance(const PowerSystem& system);
};

}  // namespace powerdyn::v1
