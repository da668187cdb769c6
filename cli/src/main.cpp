#include <CLI/CLI.hpp>
#include <powerdyn/v1/core.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>

using namespace powerdyn::v1;

namespace {

// Sentinel values to detect if CLI option was explicitly provided
constexpr double CLI_SENTINEL = -1e99;

void print_diagnostic(const Diagnostic& d) {
    std::cerr << "[" << to_string(d.severity) << "] " << to_string(d.code) << ": " << d.message
              << std::endl;
}

/// Load a case file, reporting parser errors; returns false on failure
bool load_case(const std::string& case_file, parser::SimulationCase& sim_case, bool quiet) {
    parser::YamlParser yaml_parser;
    sim_case = yaml_parser.load(case_file);
    if (!quiet) {
        for (const auto& warning : yaml_parser.warnings()) {
            std::cerr << "Warning: " << warning << std::endl;
        }
    }
    if (!yaml_parser.ok()) {
        for (const auto& error : yaml_parser.errors()) {
            std::cerr << "Error: " << error << std::endl;
        }
        return false;
    }
    sim_case.options.diagnostic_callback = quiet ? DiagnosticCallback{} : DiagnosticCallback(print_diagnostic);
    return true;
}

std::vector<std::string> signal_names(const SimulationInputs& inputs) {
    std::vector<std::string> names(static_cast<std::size_t>(inputs.variable_count()));
    const Index n = inputs.bus_count();
    for (const auto& [number, row] : inputs.network().lookup()) {
        names[static_cast<std::size_t>(row)] = "V_R(" + std::to_string(number) + ")";
        names[static_cast<std::size_t>(row + n)] = "V_I(" + std::to_string(number) + ")";
    }
    for (const auto& [device, states] : inputs.registry().devices()) {
        for (const auto& [state, ix] : states) {
            names[static_cast<std::size_t>(ix)] = device + "." + state;
        }
    }
    return names;
}

void write_csv(const Simulation& sim, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    // Header
    file << "time";
    for (const auto& name : signal_names(sim.inputs())) {
        file << "," << name;
    }
    file << "\n";

    // Data
    const DaeSolution& solution = sim.solution();
    file << std::scientific << std::setprecision(9);
    for (std::size_t i = 0; i < solution.time.size(); ++i) {
        file << solution.time[i];
        for (Index j = 0; j < solution.states[i].size(); ++j) {
            file << "," << solution.states[i](j);
        }
        file << "\n";
    }
}

int cmd_run(const std::string& case_file, const std::string& output_file,
            double cli_tstop, const std::string& cli_solver, bool verbose, bool quiet) {
    try {
        parser::SimulationCase sim_case;
        if (!quiet) {
            std::cerr << "Reading case: " << case_file << std::endl;
        }
        if (!load_case(case_file, sim_case, quiet)) {
            return 1;
        }

        // Apply CLI overrides only if explicitly provided
        if (cli_tstop != CLI_SENTINEL) sim_case.options.tspan.second = cli_tstop;
        if (cli_solver == "ida") sim_case.options.backend = DaeBackend::Ida;
        if (cli_solver == "bdf") sim_case.options.backend = DaeBackend::NativeBdf;

        Simulation sim = Simulation::build(sim_case.system, sim_case.perturbations, sim_case.options);

        if (verbose) {
            std::cerr << "System loaded:" << std::endl;
            std::cerr << "  Buses: " << sim.inputs().bus_count() << std::endl;
            std::cerr << "  Dynamic injections: " << sim.inputs().injections().size() << std::endl;
            std::cerr << "  Variables: " << sim.inputs().variable_count() << std::endl;
            std::cerr << "  Initialized: " << (sim.initialized() ? "yes" : "no") << std::endl;
            for (const IterationRecord& record : sim.initialization().history) {
                std::cerr << "    iter " << record.iteration << ": |F| = " << record.residual_norm
                          << ", |dx| = " << record.step_norm << ", damping = " << record.damping
                          << std::endl;
            }
        }

        if (!quiet) {
            std::cerr << "Running simulation..." << std::endl;
            std::cerr << "  tspan: [" << sim.options().tspan.first << ", "
                      << sim.options().tspan.second << "] s" << std::endl;
            std::cerr << "  solver: " << to_string(sim.options().backend) << std::endl;
        }

        const SimulationRunResult result = sim.run();
        if (!result.success()) {
            std::cerr << "Simulation failed: " << result.message << std::endl;
            return 1;
        }

        if (!quiet) {
            std::cerr << "Simulation completed:" << std::endl;
            std::cerr << "  Total steps: " << result.statistics.steps << std::endl;
            std::cerr << "  Rejected steps: " << result.statistics.rejected_steps << std::endl;
            std::cerr << "  Newton iterations: " << result.statistics.newton_iterations << std::endl;
            std::cerr << "  Perturbations applied: " << result.perturbations_applied.size() << std::endl;
        }

        if (!output_file.empty()) {
            if (!quiet) {
                std::cerr << "Writing results to: " << output_file << std::endl;
            }
            write_csv(sim, output_file);
        } else {
            // Write to stdout
            write_csv(sim, "/dev/stdout");
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_small_signal(const std::string& case_file, bool quiet) {
    try {
        parser::SimulationCase sim_case;
        if (!load_case(case_file, sim_case, quiet)) {
            return 1;
        }

        Simulation sim = Simulation::build(sim_case.system, sim_case.perturbations, sim_case.options);
        const SmallSignalResult result = sim.small_signal_analysis();
        if (!result.success()) {
            std::cerr << "Small-signal analysis failed: " << result.message << std::endl;
            return 1;
        }

        std::cout << "Stable: " << (result.stable ? "yes" : "no") << std::endl;
        std::cout << "Reduced Jacobian: " << result.reduced_jacobian.rows() << "x"
                  << result.reduced_jacobian.cols() << std::endl;
        std::cout << "\n" << std::setw(16) << "real" << std::setw(16) << "imag"
                  << std::setw(12) << "damping" << std::setw(12) << "freq (Hz)" << std::endl;
        std::cout << std::scientific << std::setprecision(5);
        for (Eigen::Index i = 0; i < result.eigenvalues.size(); ++i) {
            std::cout << std::setw(16) << result.eigenvalues[i].real()
                      << std::setw(16) << result.eigenvalues[i].imag()
                      << std::setw(12) << std::fixed << std::setprecision(4) << result.damping[i]
                      << std::setw(12) << result.frequency[i]
                      << std::scientific << std::setprecision(5) << std::endl;
        }
        return result.stable ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_info(const std::string& case_file) {
    try {
        parser::SimulationCase sim_case;
        if (!load_case(case_file, sim_case, true)) {
            return 1;
        }
        sim_case.options.initialize = false;
        sim_case.options.system_to_file = false;
        Simulation sim = Simulation::build(sim_case.system, sim_case.perturbations, sim_case.options);
        const SimulationInputs& inputs = sim.inputs();

        std::cout << "Case: " << case_file << std::endl;
        std::cout << "\nNetwork:" << std::endl;
        std::cout << "  Buses: " << inputs.bus_count() << std::endl;
        std::cout << "  Lines: " << inputs.system().lines.size() << std::endl;
        std::cout << "  Dynamic lines: " << inputs.system().dynamic_lines.size() << std::endl;
        std::cout << "  Voltage buses: " << inputs.network().voltage_buses().size() << std::endl;
        std::cout << "  Total variables: " << inputs.variable_count() << std::endl;

        std::cout << "\nDynamic injections (" << inputs.injections().size() << "):" << std::endl;
        for (const auto& entry : inputs.injections()) {
            const DeviceIndex& device = entry.device;
            std::cout << "  " << device.name << ": " << to_string(device.category)
                      << " at offset " << device.offset << ", " << device.size() << " states"
                      << std::endl;
            for (const ComponentKind kind : device.evaluation_order()) {
                const ComponentSlot& slot = device.slot(kind);
                std::cout << "    " << to_string(kind) << ": " << slot.local_ix.size() << " states, "
                          << slot.port_ix.size() << " ports" << std::endl;
            }
        }

        std::cout << "\nStop times:";
        for (const Real t : sim.tstops()) {
            std::cout << " " << t;
        }
        std::cout << std::endl;

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"powerdyn - Power system dynamic simulator"};
    app.set_version_flag("-V,--version", std::string("powerdyn ") + powerdyn::version);

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Run time-domain simulation");
    std::string case_file;
    std::string output_file;
    std::string cli_solver;
    double cli_tstop = CLI_SENTINEL;

    run_cmd->add_option("case", case_file, "Case file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-o,--output", output_file, "Output file (CSV)");
    run_cmd->add_option("--tstop", cli_tstop, "Stop time (overrides YAML)");
    run_cmd->add_option("--solver", cli_solver, "DAE backend (overrides YAML)")
        ->check(CLI::IsMember({"bdf", "ida"}));

    run_cmd->callback([&]() {
        std::exit(cmd_run(case_file, output_file, cli_tstop, cli_solver, verbose, quiet));
    });

    // Small-signal command
    auto* ss_cmd = app.add_subcommand("small-signal", "Small-signal stability analysis");
    std::string ss_file;
    ss_cmd->add_option("case", ss_file, "Case file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    ss_cmd->callback([&]() {
        std::exit(cmd_small_signal(ss_file, quiet));
    });

    // Info command
    auto* info_cmd = app.add_subcommand("info", "Show system indexing information");
    std::string info_file;
    info_cmd->add_option("case", info_file, "Case file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    info_cmd->callback([&]() {
        std::exit(cmd_info(info_file));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
