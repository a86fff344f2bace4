#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "army.h"
#include "battle_resolver.h"
#include "campaign_context.h"
#include "event_log.h"
#include "path_planner.h"
#include "scenario_loader.h"
#include "target_scorer.h"
#include "turn_orchestrator.h"
#include "world_map.h"

namespace {

constexpr int kNoPlayerFilter = std::numeric_limits<int>::min();

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/campaign_config.toml";
    std::string scenarioPath = "data/scenarios/border_march.toml";
    int turns = 5;
    int player = kNoPlayerFilter; // only this player moves when set
    int debug = -1;               // -1 means "use config value", 0/1 are explicit overrides
    bool quiet = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parseBool01(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "campaign_cli")
              << " [--seed N] [--config path] [--scenario path]\n"
              << "       [--turns N] [--player ID] [--debug 0|1] [--quiet]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--scenario") {
            if (!requireValue(opt.scenarioPath)) return false;
        } else if (arg.rfind("--scenario=", 0) == 0) {
            opt.scenarioPath = arg.substr(11);
        } else if (arg == "--turns") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.turns)) return false;
        } else if (arg.rfind("--turns=", 0) == 0) {
            if (!parseInt(arg.substr(8), opt.turns)) return false;
        } else if (arg == "--player") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.player)) return false;
        } else if (arg.rfind("--player=", 0) == 0) {
            if (!parseInt(arg.substr(9), opt.player)) return false;
        } else if (arg == "--debug") {
            std::string v;
            bool b = false;
            if (!requireValue(v) || !parseBool01(v, b)) return false;
            opt.debug = b ? 1 : 0;
        } else if (arg.rfind("--debug=", 0) == 0) {
            bool b = false;
            if (!parseBool01(arg.substr(8), b)) return false;
            opt.debug = b ? 1 : 0;
        } else if (arg == "--quiet") {
            opt.quiet = true;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::string ownerLabel(int owner) {
    return owner == kNeutralPlayer ? std::string("neutral") : ("player " + std::to_string(owner));
}

void printOwnershipSummary(const WorldMap& map, const ArmyRoster& roster) {
    std::map<int, int> counts;
    for (int owner : map.getOwners()) {
        ++counts[owner];
    }

    std::cout << "\nFinal ownership:\n";
    for (const auto& kv : counts) {
        std::cout << "  " << std::left << std::setw(10) << ownerLabel(kv.first) << std::right << std::setw(4)
                  << kv.second << " regions\n";
    }

    std::cout << "Regions:\n";
    for (RegionId id = 0; id < map.regionCount(); ++id) {
        const RegionProfile& p = map.regionProfile(id);
        std::cout << "  [" << id << "] " << std::left << std::setw(16) << p.name << std::right << " "
                  << std::left << std::setw(8) << adminTierName(p.tier) << std::right << " "
                  << ownerLabel(map.regionOwner(id)) << " defenders=" << p.defenders
                  << (p.stronghold ? " stronghold" : "") << "\n";
    }

    std::cout << "Armies:\n";
    for (const auto& army : roster.getArmies()) {
        std::cout << "  " << army->name() << " (#" << army->armyId() << ", " << ownerLabel(army->playerId())
                  << ") at " << map.regionProfile(army->currentRegion()).name << " strength=" << army->getStrength()
                  << "/" << army->getFullStrength() << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }
    if (opt.turns <= 0) {
        std::cerr << "Invalid --turns=" << opt.turns << " (must be > 0)\n";
        return 2;
    }

    CampaignContext ctx(opt.seed, opt.configPath);
    if (opt.debug >= 0) {
        ctx.config.orchestrator.debug = (opt.debug == 1);
    }

    WorldMap map(ctx.config);
    ArmyRoster roster(ctx.config.reinforcement.strengthThreshold);
    ScenarioInfo info;
    std::string error;
    if (!loadScenario(opt.scenarioPath, map, roster, &info, &error)) {
        std::cerr << "[Scenario] " << error << "\n";
        return 1;
    }

    GarrisonBattleResolver battles(map, roster);
    PathPlanner planner(map, ctx.config.planner);
    planner.setDebugEnabled(ctx.config.orchestrator.debug);
    TargetScorer scorer(map, planner, ctx);
    TurnOrchestrator orchestrator(map, roster, battles, planner, scorer, ctx.config.orchestrator);

    EventLog log;
    orchestrator.setEventCallback([&](const TurnEvent& ev) {
        log.record(ev, &map);
        if (!opt.quiet) {
            std::cout << log.getEvents().back() << "\n";
        }
    });

    std::cout << "Scenario: " << (info.name.empty() ? opt.scenarioPath : info.name) << " (" << info.regionCount
              << " regions, " << info.armyCount << " armies)\n"
              << "Seed: " << opt.seed << "  config: " << ctx.configPath << " [" << ctx.configHash << "]\n";

    std::vector<int> players = roster.players();
    if (opt.player != kNoPlayerFilter) {
        if (std::find(players.begin(), players.end(), opt.player) == players.end()) {
            std::cerr << "[Scenario] player " << opt.player << " has no armies\n";
            return 1;
        }
        players.assign(1, opt.player);
    }

    for (int round = 1; round <= opt.turns; ++round) {
        if (!opt.quiet) {
            std::cout << "\n=== Round " << round << " ===\n";
        }
        for (int player : players) {
            TurnSummary summary = orchestrator.runTurn(player);
            while (orchestrator.isTurnActive()) {
                if (battles.hasPending()) {
                    battles.resolvePending();
                }
                const StepStatus status = orchestrator.step();
                if (status == StepStatus::AwaitingBattle && !battles.hasPending()) {
                    std::cerr << "[Orchestrator] battle verdict never arrived for player " << player << "\n";
                    return 1;
                }
            }
            summary = orchestrator.summary();
            std::cout << "Round " << round << " " << ownerLabel(player) << ": moves=" << summary.movesExecuted
                      << " battles=" << summary.battlesStarted << " conquered=" << summary.regionsConquered
                      << " refills=" << summary.refills << " passes=" << summary.passes << "\n";
        }
    }

    printOwnershipSummary(map, roster);
    std::cout << "Events recorded: " << log.totalRecorded() << "\n";
    return 0;
}
