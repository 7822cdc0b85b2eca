// BlockTypes.cpp
//
// Port type table, default values, value coercions and patch application.
#include "BlockTypes.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace BlockFlow {

PortType parsePortType(const std::string& name) {
    if (name == "audio") return PortType::Audio;
    if (name == "number") return PortType::Number;
    if (name == "string") return PortType::String;
    if (name == "boolean") return PortType::Boolean;
    if (name == "gate") return PortType::Gate;
    if (name == "trigger") return PortType::Trigger;
    if (name == "any") return PortType::Any;
    throw std::invalid_argument("Unknown port type: " + name);
}

const char* portTypeName(PortType type) {
    switch (type) {
        case PortType::Audio: return "audio";
        case PortType::Number: return "number";
        case PortType::String: return "string";
        case PortType::Boolean: return "boolean";
        case PortType::Gate: return "gate";
        case PortType::Trigger: return "trigger";
        case PortType::Any: return "any";
    }
    return "any";
}

Value defaultValueFor(PortType type) {
    switch (type) {
        case PortType::Audio:
        case PortType::Number:
            return 0.0;
        case PortType::String:
            return std::string();
        case PortType::Boolean:
        case PortType::Gate:
            return false;
        case PortType::Trigger:
        case PortType::Any:
            return std::monostate{};
    }
    return std::monostate{};
}

bool arePortTypesCompatible(PortType from, PortType to) {
    if (from == PortType::Any || to == PortType::Any) return true;
    auto isEdge = [](PortType t) { return t == PortType::Trigger || t == PortType::Gate; };
    if (isEdge(from) && isEdge(to)) return true;
    if (from == PortType::Number && to == PortType::String) return true;
    return from == to;
}

bool isNull(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

double toNumber(const Value& v) {
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? 1.0 : 0.0;
    if (std::holds_alternative<std::string>(v)) {
        const auto& s = std::get<std::string>(v);
        try {
            return s.empty() ? 0.0 : std::stod(s);
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

bool toBool(const Value& v) {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    if (std::holds_alternative<double>(v)) return std::get<double>(v) != 0.0;
    if (std::holds_alternative<std::string>(v)) return !std::get<std::string>(v).empty();
    if (std::holds_alternative<std::vector<double>>(v)) return !std::get<std::vector<double>>(v).empty();
    return false;
}

std::string toDisplayString(const Value& v) {
    if (std::holds_alternative<double>(v)) return fmt::format("{:.6g}", std::get<double>(v));
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::string>(v)) return fmt::format("\"{}\"", std::get<std::string>(v));
    if (std::holds_alternative<std::vector<double>>(v)) {
        std::string s = "[";
        const auto& list = std::get<std::vector<double>>(v);
        for (size_t i = 0; i < list.size(); ++i) {
            if (i) s += ",";
            s += fmt::format("{:.6g}", list[i]);
        }
        return s + "]";
    }
    return "null";
}

const Port* BlockDefinition::findInput(const PortId& portId) const {
    auto it = std::find_if(inputs.begin(), inputs.end(), [&](const Port& p) { return p.id == portId; });
    return it == inputs.end() ? nullptr : &*it;
}

const Port* BlockDefinition::findOutput(const PortId& portId) const {
    auto it = std::find_if(outputs.begin(), outputs.end(), [&](const Port& p) { return p.id == portId; });
    return it == outputs.end() ? nullptr : &*it;
}

void applyPatch(BlockInstance& instance, const InstancePatch& patch) {
    if (patch.internalState) instance.internalState = *patch.internalState;
    if (patch.lastRunOutputs) instance.lastRunOutputs = *patch.lastRunOutputs;
    if (patch.error) instance.error = *patch.error;
    if (patch.needsResourceSetup) instance.needsResourceSetup = *patch.needsResourceSetup;
}

void mergeState(StateBag& state, const StateBag& partial) {
    for (const auto& kv : partial) state[kv.first] = kv.second;
}

} // namespace BlockFlow
