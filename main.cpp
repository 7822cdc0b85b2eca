// main.cpp
//
// Headless BlockFlow host. Parses CLI (CLI11, optionally from a config file),
// loads a JSON patch into the block store, attaches a simulated audio backend
// and drives the engine from a cooperative loop:
// - Advances the backend clock (device start-up, async node creation)
// - Pumps the logic tick loop
// - Prints per-instance outputs at a fixed interval
#include "BlockFlowCore.hpp"
#include "BuiltinBlocks.hpp"
#include "Log.hpp"
#include "PatchLoader.hpp"
#include "SimulatedBackend.hpp"
#include <CLI/CLI.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fmt/core.h>
#include <thread>

namespace {

std::atomic<bool> running(true);

void onSignal(int) { running = false; }

void printStatus(const BlockFlow::BlockStore& store, double nowMs) {
    fmt::print("--- t={:.0f} ms\n", nowMs);
    for (const auto& inst : store.getInstances()) {
        std::string outputs;
        for (const auto& kv : inst.lastRunOutputs) {
            if (!outputs.empty()) outputs += ", ";
            outputs += kv.first + "=" + BlockFlow::toDisplayString(kv.second);
        }
        fmt::print("{:<12} {:<16} {{{}}}{}{}\n", inst.instanceId, inst.name, outputs,
                   inst.needsResourceSetup ? " (setup pending)" : "",
                   inst.error ? " error: " + *inst.error : std::string());
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string patchPath = "patches/demo.json";
    double tickMs = BlockFlow::TickLoop::kDefaultPeriodMs;
    double bpm = 120.0;
    bool startDisabled = false;
    double durationSec = 0.0;   // 0 = until interrupted
    double disableAfterSec = 0.0; // 0 = never
    double sampleRate = 44100.0;
    double backendDelayMs = 0.0;
    double createLatencyMs = 0.0;
    std::string logLevel = "info";
    std::string clockType = "wall"; // "wall" | "virtual"
    double timeScale = 1.0;
    int printIntervalMs = 1000; // 0 = never
    CLI::App app{"BlockFlow"};
    try {
        app.add_option("--patch", patchPath, "Path to patch JSON file");
        app.add_option("--tick-ms", tickMs, "Logic tick period in ms")->check(CLI::PositiveNumber);
        app.add_option("--bpm", bpm, "Global tempo")->check(CLI::PositiveNumber);
        app.add_flag("--start-disabled", startDisabled, "Start with the global enable flag off");
        app.add_option("--duration", durationSec, "Run time in seconds (0=until interrupted)");
        app.add_option("--disable-after", disableAfterSec, "Turn the global enable flag off after N seconds (0=never)");
        // Simulated backend
        app.add_option("--sample-rate", sampleRate, "Simulated backend sample rate")->check(CLI::PositiveNumber);
        app.add_option("--backend-delay-ms", backendDelayMs, "Delay before the simulated backend becomes ready");
        app.add_option("--create-latency-ms", createLatencyMs, "Simulated asynchronous node creation latency");
        // Control/time model
        app.add_option("--clock", clockType, "Clock type: wall|virtual")->check(CLI::IsMember({"wall", "virtual"}));
        app.add_option("--time-scale", timeScale, "Time scale multiplier")->check(CLI::PositiveNumber);
        app.add_option("--print-interval", printIntervalMs, "Status print interval ms (0=off)");
        app.add_option("--log-level", logLevel, "trace|debug|info|warn|error|off");
        app.allow_extras(false);
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        BlockFlow::log::setLevel(BlockFlow::log::parseLevel(logLevel));
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }

    BlockFlow::BlockStore store;
    BlockFlow::BehaviorRegistry registry;
    BlockFlow::registerBuiltinBlocks(registry, store);

    BlockFlow::SimulatedBackend::Options backendOptions;
    backendOptions.sampleRate = sampleRate;
    backendOptions.readyAfterMs = backendDelayMs;
    backendOptions.createLatencyMs = createLatencyMs;
    BlockFlow::SimulatedBackend backend(backendOptions);

    try {
        BlockFlow::loadPatchFile(patchPath, store);
    } catch (const BlockFlow::PatchError& e) {
        fmt::print(stderr, "Failed to load patch: {}\n", e.what());
        return 1;
    }

    BlockFlow::EngineConfig config;
    config.tickPeriodMs = tickMs;
    config.bpm = bpm;
    BlockFlow::FlowEngine engine(store, registry, backend, config);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    using Steady = std::chrono::steady_clock;
    const auto start = Steady::now();
    double nowMs = 0.0;
    double lastPrint = 0.0;
    bool disabledOnSchedule = false;

    backend.advance(nowMs);
    engine.reconcile();
    engine.setSystemEnabled(!startDisabled, nowMs);

    int exitCode = 0;
    while (running) {
        if (clockType == "virtual") {
            nowMs += tickMs * timeScale;
        } else {
            nowMs = std::chrono::duration<double, std::milli>(Steady::now() - start).count() * timeScale;
        }
        if (durationSec > 0.0 && nowMs >= durationSec * 1000.0) break;
        if (disableAfterSec > 0.0 && !disabledOnSchedule && nowMs >= disableAfterSec * 1000.0) {
            engine.setSystemEnabled(false, nowMs);
            disabledOnSchedule = true;
        }

        if (backend.advance(nowMs)) engine.onBackendReadinessChanged();
        try {
            engine.pump(nowMs);
        } catch (const BlockFlow::InvariantViolation& e) {
            fmt::print(stderr, "Logic loop halted: {}\n", e.what());
            exitCode = 2;
            break;
        }

        if (printIntervalMs > 0 && nowMs - lastPrint >= printIntervalMs) {
            printStatus(store, nowMs);
            lastPrint = nowMs;
        }

        // Small delay to prevent CPU overuse
        if (clockType == "wall") std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    engine.shutdown(nowMs);
    fmt::print("ticks: {}, backend nodes: {}, backend connections: {}\n", engine.tickLoop().tickCount(),
               backend.nodeCount(), backend.connectionCount());
    return exitCode;
}
