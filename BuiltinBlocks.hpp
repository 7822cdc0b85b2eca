// BuiltinBlocks.hpp
//
// Block definitions and behaviors the host ships with. Logic blocks (value,
// arithmetic, counter, gate, envelopes, sequencer) run on the tick; audio
// blocks (oscillator, filters, output) are realized by the audio backend.
#pragma once
#include "Behavior.hpp"
#include "BlockStore.hpp"
#include <vector>

namespace BlockFlow {

namespace Builtins {
constexpr const char* NumberValue = "value";
constexpr const char* Add = "add";
constexpr const char* Multiply = "multiply";
constexpr const char* Counter = "counter";
constexpr const char* ManualGate = "manual_gate";
constexpr const char* AdEnvelope = "ad_envelope";
constexpr const char* ArEnvelope = "ar_envelope";
constexpr const char* StepSequencer = "step_sequencer";
constexpr const char* NumberToAudio = "number_to_audio";
constexpr const char* Oscillator = "oscillator";
constexpr const char* BiquadFilter = "biquad_filter";
constexpr const char* AllpassFilter = "allpass_filter";
constexpr const char* AudioOutput = "audio_output";
} // namespace Builtins

std::vector<BlockDefinition> builtinDefinitions();
void registerBuiltinBehaviors(BehaviorRegistry& registry);
// Registers every built-in behavior and adds every built-in definition.
void registerBuiltinBlocks(BehaviorRegistry& registry, BlockStore& store);

} // namespace BlockFlow
