// PatchLoader.hpp
//
// Loads a patch document into a BlockStore:
// {
//   "definitions": [ { "id", "name", "behavior", "runsAtAudioRate", "processorKind",
//                      "forwardsInputsToNode", "inputs", "outputs", "parameters" } ],
//   "instances":   [ { "id", "definition", "name", "parameters": { ... } } ],
//   "connections": [ { "id", "fromInstance", "fromPort", "toInstance", "toPort" } ]
// }
// Definitions are optional; built-ins are expected to be registered already.
#pragma once
#include "BlockStore.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace BlockFlow {

class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PatchSummary {
    size_t definitions = 0;
    size_t instances = 0;
    size_t connections = 0;
};

Value valueFromJson(const nlohmann::json& j);
BlockDefinition definitionFromJson(const nlohmann::json& j);

PatchSummary loadPatch(const nlohmann::json& json, BlockStore& store);
PatchSummary loadPatchFile(const std::string& path, BlockStore& store);

} // namespace BlockFlow
