#pragma once

// =============================================================================
// powerdyn - Component Catalogue
// =============================================================================
// Named parameter tables for every sub-model, shared by the YAML loader and
// the JSON snapshot writer. A model variant is selected by its `type_name`.
// =============================================================================

#include "powerdyn/v1/components/generator_components.hpp"
#include "powerdyn/v1/components/inverter_components.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace powerdyn::v1 {

template<typename Model>
struct ParameterField {
    const char* name;
    Real Model::* member;
};

template<typename Model>
struct ComponentParameters;

#define POWERDYN_COMPONENT_PARAMETERS(Model, ...)                                      \
    template<>                                                                         \
    struct ComponentParameters<Model> {                                                \
        static constexpr auto fields = std::to_array<ParameterField<Model>>({__VA_ARGS__}); \
    }

POWERDYN_COMPONENT_PARAMETERS(BaseMachine,
    {"R", &BaseMachine::R}, {"Xd_p", &BaseMachine::Xd_p}, {"eq_p", &BaseMachine::eq_p});
POWERDYN_COMPONENT_PARAMETERS(OneDOneQMachine,
    {"R", &OneDOneQMachine::R}, {"Xd", &OneDOneQMachine::Xd}, {"Xq", &OneDOneQMachine::Xq},
    {"Xd_p", &OneDOneQMachine::Xd_p}, {"Xq_p", &OneDOneQMachine::Xq_p},
    {"Td0_p", &OneDOneQMachine::Td0_p}, {"Tq0_p", &OneDOneQMachine::Tq0_p});
POWERDYN_COMPONENT_PARAMETERS(SingleMass, {"H", &SingleMass::H}, {"D", &SingleMass::D});
POWERDYN_COMPONENT_PARAMETERS(AVRFixed, {"v_fix", &AVRFixed::v_fix});
POWERDYN_COMPONENT_PARAMETERS(AVRSimple, {"Kv", &AVRSimple::Kv});
POWERDYN_COMPONENT_PARAMETERS(AVRTypeI,
    {"Ka", &AVRTypeI::Ka}, {"Ke", &AVRTypeI::Ke}, {"Kf", &AVRTypeI::Kf},
    {"Ta", &AVRTypeI::Ta}, {"Te", &AVRTypeI::Te}, {"Tf", &AVRTypeI::Tf},
    {"Tr", &AVRTypeI::Tr}, {"Ae", &AVRTypeI::Ae}, {"Be", &AVRTypeI::Be});
POWERDYN_COMPONENT_PARAMETERS(TGFixed, {"efficiency", &TGFixed::efficiency});
POWERDYN_COMPONENT_PARAMETERS(TGTypeII,
    {"R", &TGTypeII::R}, {"T1", &TGTypeII::T1}, {"T2", &TGTypeII::T2});
POWERDYN_COMPONENT_PARAMETERS(PSSFixed, {"v_pss", &PSSFixed::v_pss});
POWERDYN_COMPONENT_PARAMETERS(PSSSimple,
    {"K_omega", &PSSSimple::K_omega}, {"K_p", &PSSSimple::K_p});

POWERDYN_COMPONENT_PARAMETERS(FixedDCSource, {"voltage", &FixedDCSource::voltage});
POWERDYN_COMPONENT_PARAMETERS(KauraPLL,
    {"omega_lp", &KauraPLL::omega_lp}, {"kp_pll", &KauraPLL::kp_pll},
    {"ki_pll", &KauraPLL::ki_pll});
POWERDYN_COMPONENT_PARAMETERS(VirtualInertiaQDroop,
    {"Ta", &VirtualInertiaQDroop::Ta}, {"kd", &VirtualInertiaQDroop::kd},
    {"k_omega", &VirtualInertiaQDroop::k_omega}, {"kq", &VirtualInertiaQDroop::kq},
    {"omega_f", &VirtualInertiaQDroop::omega_f});
POWERDYN_COMPONENT_PARAMETERS(VoltageModeControl,
    {"kpv", &VoltageModeControl::kpv}, {"kiv", &VoltageModeControl::kiv},
    {"kffv", &VoltageModeControl::kffv}, {"rv", &VoltageModeControl::rv},
    {"lv", &VoltageModeControl::lv}, {"kpc", &VoltageModeControl::kpc},
    {"kic", &VoltageModeControl::kic}, {"kffi", &VoltageModeControl::kffi},
    {"omega_ad", &VoltageModeControl::omega_ad}, {"kad", &VoltageModeControl::kad},
    {"lf", &VoltageModeControl::lf}, {"cf", &VoltageModeControl::cf});
POWERDYN_COMPONENT_PARAMETERS(AverageConverter,
    {"rated_voltage", &AverageConverter::rated_voltage},
    {"rated_current", &AverageConverter::rated_current});
POWERDYN_COMPONENT_PARAMETERS(LCLFilter,
    {"lf", &LCLFilter::lf}, {"rf", &LCLFilter::rf}, {"cf", &LCLFilter::cf},
    {"lg", &LCLFilter::lg}, {"rg", &LCLFilter::rg});

#undef POWERDYN_COMPONENT_PARAMETERS

/// Call f(name, value&) for every parameter of a model
template<typename Model, typename F>
void for_each_parameter(Model& model, F&& f) {
    for (const auto& field : ComponentParameters<std::remove_const_t<Model>>::fields) {
        f(field.name, model.*(field.member));
    }
}

/// Pointer to the named parameter, or nullptr
template<typename Model>
[[nodiscard]] Real* find_parameter(Model& model, std::string_view name) {
    for (const auto& field : ComponentParameters<Model>::fields) {
        if (name == field.name) return &(model.*(field.member));
    }
    return nullptr;
}

/// Default-constructed alternative of `Variant` whose type_name matches
template<typename Variant>
[[nodiscard]] std::optional<Variant> make_component(std::string_view type_name) {
    std::optional<Variant> result;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        ((std::string_view(std::variant_alternative_t<I, Variant>::type_name) == type_name
              ? (result.emplace(std::in_place_index<I>), true)
              : false) || ...);
    }(std::make_index_sequence<std::variant_size_v<Variant>>{});
    return result;
}

/// type_name of the active alternative
template<typename Variant>
[[nodiscard]] const char* component_type_name(const Variant& model) {
    return std::visit([](const auto& m) -> const char* { return m.type_name; }, model);
}

}  // namespace powerdyn::v1
