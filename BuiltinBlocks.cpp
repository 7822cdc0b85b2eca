// BuiltinBlocks.cpp
#include "BuiltinBlocks.hpp"
#include "LogicExecutor.hpp"
#include <cmath>
#include <stdexcept>

namespace BlockFlow {

namespace {

Port input(const char* id, const char* name, PortType type, const char* paramTarget = nullptr) {
    Port p;
    p.id = id;
    p.name = name;
    p.direction = PortDirection::Input;
    p.type = type;
    if (paramTarget) p.paramTarget = std::string(paramTarget);
    return p;
}

Port output(const char* id, const char* name, PortType type) {
    Port p;
    p.id = id;
    p.name = name;
    p.direction = PortDirection::Output;
    p.type = type;
    return p;
}

double param(const ValueMap& params, const char* id, double fallback) {
    auto it = params.find(id);
    return it == params.end() || isNull(it->second) ? fallback : toNumber(it->second);
}

Value lookupOr(const ValueMap& map, const char* id, Value fallback) {
    auto it = map.find(id);
    return it == map.end() ? fallback : it->second;
}

// true on a false -> true transition against the value remembered under `key`
bool risingEdge(const BehaviorCall& call, const char* port, const char* key) {
    const bool now = toBool(lookupOr(call.inputs, port, Value{}));
    return now && !toBool(lookupOr(call.state, key, Value{}));
}

StateBag valueBlock(const BehaviorCall& call) {
    call.setOutput("out", lookupOr(call.params, "value", 0.0));
    return {};
}

StateBag addBlock(const BehaviorCall& call) {
    call.setOutput("sum", toNumber(call.inputs.at("a")) + toNumber(call.inputs.at("b")));
    return {};
}

StateBag multiplyBlock(const BehaviorCall& call) {
    call.setOutput("product", toNumber(call.inputs.at("a")) * toNumber(call.inputs.at("b")));
    return {};
}

StateBag counterBlock(const BehaviorCall& call) {
    double count = toNumber(lookupOr(call.state, "count", 0.0));
    if (risingEdge(call, "reset", "prevReset")) {
        count = 0;
    } else if (risingEdge(call, "trigger_in", "prevTrigger")) {
        count += 1;
    }
    call.setOutput("count", count);
    return {{"count", count},
            {"prevTrigger", toBool(call.inputs.at("trigger_in"))},
            {"prevReset", toBool(call.inputs.at("reset"))}};
}

StateBag manualGateBlock(const BehaviorCall& call) {
    call.setOutput("gate_out", toBool(lookupOr(call.params, "gate_active", false)));
    return {};
}

StateBag adEnvelopeBlock(const BehaviorCall& call) {
    StateBag next;
    if (risingEdge(call, "trigger_in", "prevTriggerState")) {
        next[StateFlags::EnvelopeNeedsTriggering] = true;
        call.log("AD Envelope trigger detected.");
    }
    next["prevTriggerState"] = toBool(call.inputs.at("trigger_in"));
    return next;
}

StateBag arEnvelopeBlock(const BehaviorCall& call) {
    const bool gate = toBool(call.inputs.at("gate_in"));
    const bool prev = toBool(lookupOr(call.state, "prevGateState", false));
    StateBag next;
    next[StateFlags::GateChangedToHigh] = gate && !prev;
    next[StateFlags::GateChangedToLow] = !gate && prev;
    if (gate && !prev) call.log("AR Envelope gate became HIGH.");
    if (!gate && prev) call.log("AR Envelope gate became LOW.");
    next["prevGateState"] = gate;
    return next;
}

// Advances on a rising edge of `next`, or on its own every `stepBeats` beats
// at the current bpm when `internalClock` is set.
StateBag stepSequencerBlock(const BehaviorCall& call) {
    const double steps = std::floor(param(call.params, "steps", 8));
    if (!std::isfinite(steps) || steps < 1) {
        throw std::invalid_argument("steps must be a finite number of at least 1");
    }
    std::vector<double> sequence;
    auto seq = call.params.find("sequence");
    if (seq != call.params.end() && std::holds_alternative<std::vector<double>>(seq->second)) {
        sequence = std::get<std::vector<double>>(seq->second);
    }

    double step = toNumber(lookupOr(call.state, "currentStep", 0.0));
    Value lastStep = lookupOr(call.state, "lastStepMs", Value{});
    const double now = call.context.tickTimeMs;
    bool advance = risingEdge(call, "next", "prevNext");

    if (toBool(lookupOr(call.params, "internalClock", false)) && call.context.bpm > 0) {
        const double stepMs = 60000.0 / call.context.bpm * param(call.params, "stepBeats", 0.25);
        if (isNull(lastStep)) {
            lastStep = now;
        } else if (now - toNumber(lastStep) >= stepMs) {
            advance = true;
        }
    }
    if (advance) {
        step = std::fmod(step + 1, steps);
        lastStep = now;
    }
    if (risingEdge(call, "reset", "prevReset")) {
        step = 0;
        advance = true;
    }
    if (!(step >= 0) || step >= steps) step = 0;

    const size_t index = static_cast<size_t>(step);
    call.setOutput("output", index < sequence.size() ? sequence[index] : 0.0);
    call.setOutput("step", step);
    if (advance) call.setOutput("trigger_out", true);

    return {{"currentStep", step},
            {"lastStepMs", lastStep},
            {"prevNext", toBool(call.inputs.at("next"))},
            {"prevReset", toBool(call.inputs.at("reset"))}};
}

// The node itself is driven by the forwarded inputs; nothing to compute here.
StateBag numberToAudioBlock(const BehaviorCall&) {
    return {};
}

StateBag oscillatorBlock(const BehaviorCall& call) {
    StateBag next;
    const Value waveform = lookupOr(call.params, "waveform", std::string("sine"));
    if (lookupOr(call.state, "lastWaveform", Value{}) != waveform) {
        if (!std::holds_alternative<std::string>(waveform)) throw std::invalid_argument("waveform must be a string");
        const std::string& name = std::get<std::string>(waveform);
        call.postMessage({{"type", "SET_WAVEFORM"}, {"waveform", name}});
        call.log("Waveform changed to: " + name);
        next["lastWaveform"] = waveform;
    }
    if (risingEdge(call, "trigger_in", "prevTriggerState")) {
        call.postMessage({{"type", "TRIGGER_PHASE_RESET"}});
        call.log("Phase reset triggered.");
    }
    next["prevTriggerState"] = toBool(call.inputs.at("trigger_in"));
    return next;
}

void addBehavior(BehaviorRegistry& registry, const char* id, StateBag (*fn)(const BehaviorCall&)) {
    registry.registerBehavior(id, [fn] { return BlockBehavior(fn); });
}

} // namespace

std::vector<BlockDefinition> builtinDefinitions() {
    std::vector<BlockDefinition> defs;

    BlockDefinition value;
    value.id = value.behaviorId = Builtins::NumberValue;
    value.name = "Value";
    value.outputs = {output("out", "Value", PortType::Number)};
    value.parameters = {{"value", 0.0}};
    defs.push_back(value);

    BlockDefinition add;
    add.id = add.behaviorId = Builtins::Add;
    add.name = "Add";
    add.inputs = {input("a", "A", PortType::Number), input("b", "B", PortType::Number)};
    add.outputs = {output("sum", "Sum", PortType::Number)};
    defs.push_back(add);

    BlockDefinition multiply;
    multiply.id = multiply.behaviorId = Builtins::Multiply;
    multiply.name = "Multiply";
    multiply.inputs = {input("a", "A", PortType::Number), input("b", "B", PortType::Number)};
    multiply.outputs = {output("product", "Product", PortType::Number)};
    defs.push_back(multiply);

    BlockDefinition counter;
    counter.id = counter.behaviorId = Builtins::Counter;
    counter.name = "Counter";
    counter.inputs = {input("trigger_in", "Trigger", PortType::Trigger), input("reset", "Reset", PortType::Trigger)};
    counter.outputs = {output("count", "Count", PortType::Number)};
    defs.push_back(counter);

    BlockDefinition gate;
    gate.id = gate.behaviorId = Builtins::ManualGate;
    gate.name = "Manual Gate";
    gate.outputs = {output("gate_out", "Gate Output", PortType::Gate)};
    gate.parameters = {{"gate_active", false}};
    defs.push_back(gate);

    BlockDefinition ad;
    ad.id = ad.behaviorId = Builtins::AdEnvelope;
    ad.name = "AD Envelope";
    ad.runsAtAudioRate = true;
    ad.inputs = {input("trigger_in", "Trigger", PortType::Trigger)};
    ad.outputs = {output("audio_out", "Envelope Output", PortType::Audio)};
    ad.parameters = {{"attackTime", 0.1}, {"decayTime", 0.3}, {"peakLevel", 1.0}};
    defs.push_back(ad);

    BlockDefinition ar;
    ar.id = ar.behaviorId = Builtins::ArEnvelope;
    ar.name = "AR Envelope";
    ar.runsAtAudioRate = true;
    ar.inputs = {input("gate_in", "Gate", PortType::Gate)};
    ar.outputs = {output("audio_out", "Envelope Output", PortType::Audio)};
    ar.parameters = {{"attackTime", 0.1}, {"releaseTime", 0.5}, {"sustainLevel", 0.7}};
    defs.push_back(ar);

    BlockDefinition seq;
    seq.id = seq.behaviorId = Builtins::StepSequencer;
    seq.name = "Step Sequencer";
    seq.inputs = {input("next", "Next", PortType::Trigger), input("reset", "Reset", PortType::Trigger)};
    seq.outputs = {output("output", "Step Value", PortType::Number), output("step", "Step", PortType::Number),
                   output("trigger_out", "Trigger Output", PortType::Trigger)};
    seq.parameters = {{"sequence", std::vector<double>{1, 0, 0, 0, 1, 0, 0, 0}},
                      {"steps", 8.0},
                      {"internalClock", true},
                      {"stepBeats", 0.25}};
    defs.push_back(seq);

    BlockDefinition n2a;
    n2a.id = n2a.behaviorId = Builtins::NumberToAudio;
    n2a.name = "Number to Constant Audio";
    n2a.runsAtAudioRate = true;
    n2a.forwardsInputsToNode = true;
    n2a.inputs = {input("number_in", "Number In", PortType::Number)};
    n2a.outputs = {output("audio_out", "Audio Output", PortType::Audio)};
    n2a.parameters = {{"gain", 1.0}, {"max_input_value", 255.0}};
    defs.push_back(n2a);

    BlockDefinition osc;
    osc.id = osc.behaviorId = Builtins::Oscillator;
    osc.name = "Oscillator";
    osc.runsAtAudioRate = true;
    osc.processorKind = ProcessorKind::Custom;
    osc.inputs = {input("freq_in", "Frequency CV", PortType::Audio, "frequency"),
                  input("trigger_in", "Trigger", PortType::Trigger)};
    osc.outputs = {output("audio_out", "Audio Output", PortType::Audio)};
    osc.parameters = {{"frequency", 220.0}, {"waveform", std::string("sine")}, {"gain", 0.5}};
    defs.push_back(osc);

    BlockDefinition biquad;
    biquad.id = Builtins::BiquadFilter;
    biquad.name = "Biquad Filter";
    biquad.runsAtAudioRate = true;
    biquad.inputs = {input("audio_in", "Audio Input", PortType::Audio),
                     input("freq_in", "Frequency CV", PortType::Audio, "frequency")};
    biquad.outputs = {output("audio_out", "Audio Output", PortType::Audio)};
    biquad.parameters = {{"frequency", 350.0}, {"q", 1.0}, {"type", std::string("lowpass")}};
    defs.push_back(biquad);

    // One logical input feeding two internal stages.
    BlockDefinition allpass;
    allpass.id = Builtins::AllpassFilter;
    allpass.name = "Allpass Filter";
    allpass.runsAtAudioRate = true;
    allpass.inputs = {input("audio_in", "Audio Input", PortType::Audio)};
    allpass.outputs = {output("audio_out", "Audio Output", PortType::Audio)};
    allpass.parameters = {{"delayTime", 0.01}, {"feedback", 0.5}};
    defs.push_back(allpass);

    BlockDefinition out;
    out.id = Builtins::AudioOutput;
    out.name = "Audio Output";
    out.runsAtAudioRate = true;
    out.inputs = {input("audio_in", "Audio Input", PortType::Audio)};
    out.parameters = {{"volume", 0.5}};
    defs.push_back(out);

    return defs;
}

void registerBuiltinBehaviors(BehaviorRegistry& registry) {
    addBehavior(registry, Builtins::NumberValue, valueBlock);
    addBehavior(registry, Builtins::Add, addBlock);
    addBehavior(registry, Builtins::Multiply, multiplyBlock);
    addBehavior(registry, Builtins::Counter, counterBlock);
    addBehavior(registry, Builtins::ManualGate, manualGateBlock);
    addBehavior(registry, Builtins::AdEnvelope, adEnvelopeBlock);
    addBehavior(registry, Builtins::ArEnvelope, arEnvelopeBlock);
    addBehavior(registry, Builtins::StepSequencer, stepSequencerBlock);
    addBehavior(registry, Builtins::NumberToAudio, numberToAudioBlock);
    addBehavior(registry, Builtins::Oscillator, oscillatorBlock);
}

void registerBuiltinBlocks(BehaviorRegistry& registry, BlockStore& store) {
    registerBuiltinBehaviors(registry);
    for (auto& def : builtinDefinitions()) store.addDefinition(std::move(def));
}

} // namespace BlockFlow
