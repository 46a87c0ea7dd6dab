// tools/townlife_sim/main.cpp
//
// Headless runner: builds the demo town, runs the engine on its own thread
// and prints the activity feed plus a status line per simulated second.

#include "CommandLine.hpp"
#include "DemoWorld.hpp"

#include "townlife/core/Config.hpp"
#include "townlife/core/Log.hpp"
#include "townlife/persist/StateStore.hpp"
#include "townlife/sim/SimulationEngine.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <thread>

using namespace townlife;

namespace {

std::atomic<bool> g_stop{false};

void OnSignal(int) { g_stop.store(true); }

std::string StatusLine(const nlohmann::json& snap) {
    const auto& t = snap["time"];
    std::string line = fmt::format("day {} {:02d}:{:02d}", t.value("day", 1), t.value("hour", 0), t.value("minute", 0));
    for (const auto& c : snap["characters"]) {
        std::string doing = c.value("isMoving", false) ? "walking" : "idle";
        if (c.contains("currentAction")) doing = c["currentAction"].value("actionId", "?");
        line += fmt::format(" | {} @{} {}", c.value("id", "?"), c.value("mapId", "?"), doing);
    }
    return line;
}

} // namespace

int main(int argc, char** argv) {
    const demo::CommandLineArgs args = demo::ParseCommandLineArgs(argc, argv);
    if (args.showHelp) {
        std::fputs(demo::BuildCommandLineHelpText().c_str(), stdout);
        return 0;
    }
    if (!args.unknown.empty()) {
        for (const auto& u : args.unknown) std::fprintf(stderr, "unknown or malformed argument: %s\n", u.c_str());
        std::fputs(demo::BuildCommandLineHelpText().c_str(), stderr);
        return 2;
    }

    logsys::Options logOpts;
    if (args.logDir) logOpts.directory = *args.logDir;
    logOpts.level = args.verbose ? spdlog::level::debug : spdlog::level::info;
    logsys::init(logOpts);

    config::SimulationConfig cfg;
    if (args.configPath) {
        auto loaded = config::LoadConfig(*args.configPath);
        if (!loaded) {
            spdlog::error("[Sim] config {}: {}", *args.configPath, loaded.error().message);
            return 1;
        }
        cfg = std::move(*loaded);
    }
    if (args.seed) cfg.behavior.seed = *args.seed;
    if (args.dataDir) cfg.persistence.directory = *args.dataDir;

    sim::EngineOptions opts;
    if (cfg.persistence.directory.empty())
        opts.store = std::make_shared<persist::MemoryStore>();
    else
        opts.store = std::make_shared<persist::JsonFileStore>(cfg.persistence.directory);

    try {
        sim::SimulationEngine engine(cfg, opts);
        engine.initialize(demo::MakeDemoWorld());

        if (args.restore && !engine.restoreFromStore())
            spdlog::warn("[Sim] nothing to restore, starting fresh");

        engine.events().subscribeAll([](const sim::Event& e) {
            spdlog::info("[Activity] {} {} {}{}", e.agentId, sim::to_string(e.kind), e.subject,
                         e.msg.empty() ? std::string{} : " (" + e.msg + ")");
        });

        const int perSecond = std::max(1, cfg.tickRate / std::max(1, cfg.notifyEveryTicks));
        int seen = 0;
        engine.subscribe([&seen, perSecond](const nlohmann::json& snap) {
            if (++seen % perSecond == 0) spdlog::info("[Status] {}", StatusLine(snap));
        });

        std::signal(SIGINT, OnSignal);
        std::signal(SIGTERM, OnSignal);

        engine.triggerInitialDecisions();
        engine.start();

        const int seconds = args.seconds.value_or(30);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        while (!g_stop.load() && (seconds == 0 || std::chrono::steady_clock::now() < deadline))
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

        engine.shutdown();
    } catch (const std::exception& ex) {
        spdlog::critical("[Sim] {}", ex.what());
        return 1;
    }

    spdlog::info("[Sim] done");
    logsys::get()->flush();
    return 0;
}
