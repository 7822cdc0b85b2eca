// BlockTypes.hpp
//
// Graph model shared by every BlockFlow component: values that flow on ports,
// port/definition/instance/connection records, and the partial-update form
// the state store accepts. Definitions are shared and immutable; instances
// are plain values copied into a per-tick snapshot.
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace BlockFlow {

using InstanceId = std::string;
using DefinitionId = std::string;
using PortId = std::string;
using ConnectionId = std::string;

// Scalar value that can flow on ports, parameters and state entries.
// std::monostate is "null" (unset trigger/any).
using Value = std::variant<std::monostate, bool, double, std::string, std::vector<double>>;
using ValueMap = std::unordered_map<std::string, Value>;
// Block-private state, persisted across ticks. Merged with shallow override.
using StateBag = std::unordered_map<std::string, Value>;

enum class PortType { Audio, Number, String, Boolean, Gate, Trigger, Any };
enum class PortDirection { Input, Output };

PortType parsePortType(const std::string& name);
const char* portTypeName(PortType type);

// Value an unconnected (or unset) port of this type observes.
Value defaultValueFor(PortType type);

// Whether an output of type `from` may be wired into an input of type `to`.
bool arePortTypesCompatible(PortType from, PortType to);

bool isNull(const Value& v);
double toNumber(const Value& v);
bool toBool(const Value& v);
std::string toDisplayString(const Value& v);

struct Port {
    PortId id;
    std::string name;
    PortDirection direction = PortDirection::Input;
    PortType type = PortType::Any;
    // Backend automation parameter this input drives when wired with audio.
    std::optional<std::string> paramTarget;
};

struct ParameterSpec {
    std::string id;
    Value defaultValue;
};

// Generic backend node vs. custom processing unit (sendMessage target).
enum class ProcessorKind { Native, Custom };

struct BlockDefinition {
    DefinitionId id;
    std::string name;
    std::vector<Port> inputs;
    std::vector<Port> outputs;
    std::vector<ParameterSpec> parameters;
    // Registered behavior id; empty for backend-managed blocks with no logic.
    std::string behaviorId;
    bool runsAtAudioRate = false;
    ProcessorKind processorKind = ProcessorKind::Native;
    // Push params + resolved inputs to the backend node after each run.
    bool forwardsInputsToNode = false;

    bool hasBehavior() const { return !behaviorId.empty(); }
    const Port* findInput(const PortId& portId) const;
    const Port* findOutput(const PortId& portId) const;
};

using DefinitionPtr = std::shared_ptr<const BlockDefinition>;

struct BlockInstance {
    InstanceId instanceId;
    DefinitionId definitionId;
    std::string name;
    ValueMap parameters;
    StateBag internalState;
    ValueMap lastRunOutputs;
    std::optional<std::string> error;
    bool needsResourceSetup = false;
    std::vector<std::string> logs; // newest first
};

struct Connection {
    ConnectionId id;
    InstanceId fromInstance;
    PortId fromPort;
    InstanceId toInstance;
    PortId toPort;
};

using DefinitionLookup = std::function<DefinitionPtr(const BlockInstance&)>;

// Partial update. Unset fields are left untouched by the store.
struct InstancePatch {
    std::optional<StateBag> internalState;
    std::optional<ValueMap> lastRunOutputs;
    // Outer optional: touch the field; inner: new error (nullopt clears it).
    std::optional<std::optional<std::string>> error;
    std::optional<bool> needsResourceSetup;
};

using InstanceTransform = std::function<BlockInstance(const BlockInstance&)>;

struct InstanceUpdate {
    InstanceId instanceId;
    std::variant<InstancePatch, InstanceTransform> change;
};

void applyPatch(BlockInstance& instance, const InstancePatch& patch);

// Shallow merge: keys in `partial` overwrite, keys absent from it persist.
void mergeState(StateBag& state, const StateBag& partial);

// Raised for a corrupted graph model. The only error allowed to escape a tick.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace BlockFlow
