// SimulatedBackend.cpp
#include "SimulatedBackend.hpp"
#include "Log.hpp"
#include <algorithm>

namespace BlockFlow {

namespace {
const char* kComponent = "SimBackend";

std::string describe(const BackendEndpoint& endpoint) {
    if (std::holds_alternative<NodeHandle>(endpoint)) return fmt::format("node#{}", std::get<NodeHandle>(endpoint));
    const auto& p = std::get<ParamHandle>(endpoint);
    return fmt::format("node#{}.{}", p.node, p.name);
}
} // namespace

SimulatedBackend::SimulatedBackend(Options options) : options(options) {
    ready = options.readyAfterMs <= 0.0;
}

bool SimulatedBackend::advance(double now) {
    nowMs = now;
    bool flipped = false;
    if (!ready && now >= options.readyAfterMs) {
        ready = true;
        flipped = true;
        log::info(kComponent, "audio device started ({} Hz)", options.sampleRate);
    }
    // Completions run from the host loop, never from inside createNode.
    while (!pending.empty() && pending.front().dueMs <= now) {
        PendingCreate job = std::move(pending.front());
        pending.pop_front();
        if (!ready) {
            job.done(false, "audio device stopped");
            continue;
        }
        nodes[job.instanceId] = job.handles;
        log::debug(kComponent, "node created for {}", job.instanceId);
        job.done(true, std::string());
    }
    return flipped;
}

bool SimulatedBackend::setReady(bool value) {
    if (ready == value) return false;
    ready = value;
    if (!ready) {
        // A stopped device takes its graph with it.
        nodes.clear();
        links.clear();
    }
    log::info(kComponent, "audio device {}", ready ? "started" : "stopped");
    return true;
}

NodeHandles SimulatedBackend::allocate(const BlockDefinition& definition) {
    NodeHandles h;
    bool hasAudioIn = false;
    bool hasAudioOut = false;
    for (const auto& p : definition.inputs) hasAudioIn = hasAudioIn || (p.type == PortType::Audio && !p.paramTarget);
    for (const auto& p : definition.outputs) hasAudioOut = hasAudioOut || p.type == PortType::Audio;

    const NodeHandle main = nextHandle++;
    if (hasAudioOut) h.output = main;
    if (hasAudioIn) h.input = main;
    if (definition.id == "allpass_filter") {
        // two cascaded stages share the logical input
        h.inputPaths = {nextHandle++, nextHandle++};
    }
    for (const auto& p : definition.inputs) {
        if (p.paramTarget) h.params[*p.paramTarget] = ParamHandle{main, *p.paramTarget};
    }
    if (h.input == kInvalidNode && h.output == kInvalidNode) h.output = main;
    return h;
}

void SimulatedBackend::createNode(const BlockDefinition& definition, const InstanceId& instanceId,
                                  const ValueMap& initialParams, CreateCallback done) {
    if (!ready) {
        done(false, "audio device is not running");
        return;
    }
    NodeHandles handles = allocate(definition);
    log::debug(kComponent, "createNode {} ({}, {} params)", instanceId, definition.id, initialParams.size());
    if (options.createLatencyMs > 0.0) {
        pending.push_back(PendingCreate{nowMs + options.createLatencyMs, instanceId, std::move(handles), std::move(done)});
        return;
    }
    nodes[instanceId] = std::move(handles);
    done(true, std::string());
}

bool SimulatedBackend::ownsNode(NodeHandle handle) const {
    for (const auto& kv : nodes) {
        const NodeHandles& h = kv.second;
        if (h.input == handle || h.output == handle) return true;
        if (std::find(h.inputPaths.begin(), h.inputPaths.end(), handle) != h.inputPaths.end()) return true;
    }
    return false;
}

void SimulatedBackend::destroyNode(const InstanceId& instanceId) {
    auto it = nodes.find(instanceId);
    if (it == nodes.end()) return;
    const NodeHandles h = it->second;
    nodes.erase(it);
    // dangling links go with the node
    links.erase(std::remove_if(links.begin(), links.end(),
                               [&](const std::pair<NodeHandle, BackendEndpoint>& l) {
                                   return !ownsNode(l.first) ||
                                          (std::holds_alternative<NodeHandle>(l.second) &&
                                           !ownsNode(std::get<NodeHandle>(l.second))) ||
                                          (std::holds_alternative<ParamHandle>(l.second) &&
                                           !ownsNode(std::get<ParamHandle>(l.second).node));
                               }),
                links.end());
    log::debug(kComponent, "destroyNode {} (node#{})", instanceId, h.output != kInvalidNode ? h.output : h.input);
}

void SimulatedBackend::connect(NodeHandle source, const BackendEndpoint& target) {
    if (!ready) throw BackendError("audio device is not running");
    const NodeHandle targetNode = std::holds_alternative<NodeHandle>(target) ? std::get<NodeHandle>(target)
                                                                             : std::get<ParamHandle>(target).node;
    if (!ownsNode(source)) throw BackendError(fmt::format("unknown source node#{}", source));
    if (!ownsNode(targetNode)) throw BackendError(fmt::format("unknown target {}", describe(target)));
    links.emplace_back(source, target);
    log::debug(kComponent, "connect node#{} -> {}", source, describe(target));
}

void SimulatedBackend::disconnect(NodeHandle source, const BackendEndpoint& target) {
    auto it = std::find_if(links.begin(), links.end(), [&](const std::pair<NodeHandle, BackendEndpoint>& l) {
        return l.first == source && l.second == target;
    });
    if (it == links.end()) {
        throw BackendError(fmt::format("node#{} is not connected to {}", source, describe(target)));
    }
    links.erase(it);
    log::debug(kComponent, "disconnect node#{} -> {}", source, describe(target));
}

void SimulatedBackend::sendMessage(const InstanceId& instanceId, const nlohmann::json& payload) {
    log::debug(kComponent, "message to {}: {}", instanceId, payload.dump());
}

std::optional<NodeHandles> SimulatedBackend::resolveHandles(const InstanceId& instanceId) const {
    auto it = nodes.find(instanceId);
    if (it == nodes.end()) return std::nullopt;
    return it->second;
}

void SimulatedBackend::updateNodeParams(const InstanceId& instanceId, const ValueMap& params, const ValueMap& inputs,
                                        double bpm) {
    log::trace(kComponent, "params for {}: {} params, {} inputs @ {} bpm", instanceId, params.size(), inputs.size(),
               bpm);
}

void SimulatedBackend::triggerAttackDecay(const InstanceId& instanceId, double attack, double decay, double peak) {
    log::debug(kComponent, "{}: attack {}s decay {}s peak {}", instanceId, attack, decay, peak);
}

void SimulatedBackend::triggerAttackHold(const InstanceId& instanceId, double attack, double sustain) {
    log::debug(kComponent, "{}: attack {}s hold at {}", instanceId, attack, sustain);
}

void SimulatedBackend::triggerRelease(const InstanceId& instanceId, double release) {
    log::debug(kComponent, "{}: release {}s", instanceId, release);
}

} // namespace BlockFlow
