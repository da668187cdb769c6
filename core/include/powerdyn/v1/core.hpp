#pragma once

// =============================================================================
// powerdyn - Public API
// =============================================================================

#include "powerdyn/v1/numeric_types.hpp"
#include "powerdyn/v1/diagnostics.hpp"
#include "powerdyn/v1/components/base.hpp"
#include "powerdyn/v1/components/generator_components.hpp"
#include "powerdyn/v1/components/inverter_components.hpp"
#include "powerdyn/v1/components/catalogue.hpp"
#include "powerdyn/v1/device_index.hpp"
#include "powerdyn/v1/system.hpp"
#include "powerdyn/v1/network.hpp"
#include "powerdyn/v1/simulation_inputs.hpp"
#include "powerdyn/v1/residual.hpp"
#include "powerdyn/v1/jacobian.hpp"
#include "powerdyn/v1/perturbations.hpp"
#include "powerdyn/v1/solver.hpp"
#include "powerdyn/v1/integration.hpp"
#include "powerdyn/v1/dae_solver.hpp"
#include "powerdyn/v1/initialization.hpp"
#include "powerdyn/v1/small_signal.hpp"
#include "powerdyn/v1/simulation.hpp"
#include "powerdyn/v1/io/json_export.hpp"
#include "powerdyn/v1/parser/yaml_parser.hpp"

namespace powerdyn {

inline constexpr const char* version = "0.1.0";

}  // namespace powerdyn
