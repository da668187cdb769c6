#pragma once

#include "powerdyn/v1/perturbations.hpp"
#include "powerdyn/v1/simulation.hpp"
#include "powerdyn/v1/system.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace powerdyn::v1::parser {

struct YamlParserOptions {
    bool strict = true;  // Fail on unknown fields
};

/// Everything a case file describes
struct SimulationCase {
    PowerSystem system;
    std::vector<Perturbation> perturbations;
    SimulationOptions options;
};

class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    SimulationCase load(const std::filesystem::path& path);

    // Parse from string
    SimulationCase load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    bool ok() const { return errors_.empty(); }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, SimulationCase& sim_case);
};

}  // namespace powerdyn::v1::parser
