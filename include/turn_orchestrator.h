#pragma once

#include <functional>
#include <limits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "campaign_context.h"
#include "campaign_services.h"

class PathPlanner;
class TargetScorer;

enum class GoalTag {
    Normal,
    Reinforce
};

struct MoveCandidate {
    Mover* mover = nullptr;
    RegionId target = kNoRegion;
    std::vector<RegionId> path; // current region..target
    int mpCost = 0;
    double finalScore = 0.0;    // +infinity for a reinforcement detour
    bool canReachNow = false;
    GoalTag goal = GoalTag::Normal;
};

// Per-turn scratch state. Lives from beginTurn() until the turn finishes.
struct TurnState {
    int playerId = kNeutralPlayer;
    int turnNumber = 0;
    int pass = 0;
    std::unordered_set<int> moved;               // army ids
    std::unordered_set<int> needsReinforcement;  // snapshot taken at turn start
    std::vector<RegionId> frontier;
    std::vector<MoveCandidate> candidates;
    bool awaitingBattle = false;
    int battleArmyId = -1;
    RegionId battleRegion = kNoRegion;
};

enum class StepStatus {
    Idle,           // no turn in progress
    MoveExecuted,
    AwaitingBattle,
    TurnFinished
};

struct TurnSummary {
    int playerId = kNeutralPlayer;
    int turnNumber = 0;
    int passes = 0;
    int movesExecuted = 0;
    int refills = 0;
    int battlesStarted = 0;
    int regionsConquered = 0;
    bool cancelled = false;
    bool suspended = false; // runTurn returned while a battle verdict was outstanding
};

enum class TurnEventType {
    TurnStarted,
    MovePrepared,
    MoveStarted,
    BattleStarted,
    BattleResolved,
    RegionConquered,
    ArmyReinforced,
    TurnFinished
};

const char* turnEventTypeName(TurnEventType type);

struct TurnEvent {
    TurnEventType type = TurnEventType::TurnStarted;
    int playerId = kNeutralPlayer;
    int turnNumber = 0;
    int armyId = -1;
    RegionId from = kNoRegion;
    RegionId to = kNoRegion;
    int mpCost = 0;
    double score = 0.0;
    GoalTag goal = GoalTag::Normal;
    BattleVerdict verdict = BattleVerdict::Draw; // BattleResolved only
};

using TurnEventCallback = std::function<void(const TurnEvent&)>;

class TurnOrchestrator {
public:
    TurnOrchestrator(TerritoryService& territory,
                     ForceService& forces,
                     BattleService& battles,
                     PathPlanner& planner,
                     TargetScorer& scorer,
                     const CampaignConfig::Orchestrator& config);

    // Starts a turn for `playerId`. Returns false if a turn is already in progress.
    bool beginTurn(int playerId);
    // Runs one pass of the movement loop; at most one army moves per call.
    StepStatus step();
    // beginTurn() followed by step() until the turn ends or a battle verdict is deferred.
    TurnSummary runTurn(int playerId);
    // The turn ends at the next step boundary. An outstanding battle is waited for.
    void requestCancel();

    // Best candidate per eligible army, in roster order, against a freshly computed frontier.
    // Empty when no turn is in progress.
    std::vector<MoveCandidate> collectCandidates();

    bool isTurnActive() const { return m_active; }
    const TurnState& state() const { return m_state; }
    // Summary of the turn in progress, or of the last finished one.
    const TurnSummary& summary() const { return m_summary; }

    void setEventCallback(TurnEventCallback callback) { m_onEvent = std::move(callback); }
    void setDebugEnabled(bool enabled) { m_debugEnabled = enabled; }

private:
    std::vector<MoveCandidate> buildCandidates();
    int planningHorizonFor(const Mover& mover) const;
    bool evaluateReinforcement(Mover& mover, MoveCandidate& out);
    bool evaluateFrontier(Mover& mover, MoveCandidate& out);
    int refillInPlace();
    const MoveCandidate* pickBest(const std::vector<MoveCandidate>& candidates) const;
    StepStatus execute(const MoveCandidate& candidate);
    void onBattleVerdict(int battleToken, BattleVerdict verdict);
    void finishTurn();
    void emit(TurnEvent event) const;
    bool tracing() const;

    TerritoryService& m_territory;
    ForceService& m_forces;
    BattleService& m_battles;
    PathPlanner& m_planner;
    TargetScorer& m_scorer;
    CampaignConfig::Orchestrator m_config;

    TurnState m_state;
    TurnSummary m_summary;
    TurnEventCallback m_onEvent;
    bool m_active = false;
    bool m_cancelRequested = false;
    int m_turnCounter = 0;
    int m_battleToken = 0;
    bool m_debugEnabled = false;
};
