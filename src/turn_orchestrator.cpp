#include "turn_orchestrator.h"

#include "path_planner.h"
#include "target_scorer.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace {

constexpr double kForcedScore = std::numeric_limits<double>::infinity();

int traceTurnNumber() {
    static int turn = []() {
        const char* v = std::getenv("CAMPAIGN_TRACE_TURN");
        if (!v || !*v) return std::numeric_limits<int>::max();
        return std::atoi(v);
    }();
    return turn;
}

} // namespace

const char* turnEventTypeName(TurnEventType type) {
    switch (type) {
        case TurnEventType::TurnStarted: return "TurnStarted";
        case TurnEventType::MovePrepared: return "MovePrepared";
        case TurnEventType::MoveStarted: return "MoveStarted";
        case TurnEventType::BattleStarted: return "BattleStarted";
        case TurnEventType::BattleResolved: return "BattleResolved";
        case TurnEventType::RegionConquered: return "RegionConquered";
        case TurnEventType::ArmyReinforced: return "ArmyReinforced";
        case TurnEventType::TurnFinished: return "TurnFinished";
    }
    return "";
}

TurnOrchestrator::TurnOrchestrator(TerritoryService& territory,
                                   ForceService& forces,
                                   BattleService& battles,
                                   PathPlanner& planner,
                                   TargetScorer& scorer,
                                   const CampaignConfig::Orchestrator& config)
    : m_territory(territory),
      m_forces(forces),
      m_battles(battles),
      m_planner(planner),
      m_scorer(scorer),
      m_config(config),
      m_debugEnabled(config.debug) {}

bool TurnOrchestrator::beginTurn(int playerId) {
    if (m_active) {
        std::cerr << "[Orchestrator] turn " << m_state.turnNumber << " for player " << m_state.playerId
                  << " still in progress; ignoring beginTurn for player " << playerId << "\n";
        return false;
    }

    m_state = TurnState{};
    m_state.playerId = playerId;
    m_state.turnNumber = ++m_turnCounter;
    m_summary = TurnSummary{};
    m_summary.playerId = playerId;
    m_summary.turnNumber = m_state.turnNumber;
    m_cancelRequested = false;
    m_active = true;

    m_forces.allocateTurnStart(playerId);
    for (Mover* mover : m_forces.armiesOf(playerId)) {
        if (mover && m_forces.needsReinforcement(*mover)) {
            m_state.needsReinforcement.insert(mover->armyId());
        }
    }

    TurnEvent ev;
    ev.type = TurnEventType::TurnStarted;
    emit(ev);
    return true;
}

StepStatus TurnOrchestrator::step() {
    if (!m_active) {
        return StepStatus::Idle;
    }
    if (m_state.awaitingBattle) {
        return StepStatus::AwaitingBattle;
    }
    if (m_cancelRequested) {
        m_summary.cancelled = true;
        finishTurn();
        return StepStatus::TurnFinished;
    }

    ++m_state.pass;
    m_summary.passes = m_state.pass;

    m_state.frontier = m_territory.frontierRegions(m_state.playerId);
    if (m_state.frontier.empty()) {
        if (tracing()) {
            std::cout << "[Orchestrator] turn=" << m_state.turnNumber << " pass=" << m_state.pass
                      << " empty frontier" << std::endl;
        }
        finishTurn();
        return StepStatus::TurnFinished;
    }

    const int refilled = refillInPlace();
    m_state.candidates = buildCandidates();

    if (tracing()) {
        std::cout << "[Orchestrator] turn=" << m_state.turnNumber << " player=" << m_state.playerId
                  << " pass=" << m_state.pass << " frontier=" << m_state.frontier.size()
                  << " refilled=" << refilled << " candidates=" << m_state.candidates.size() << std::endl;
    }

    const MoveCandidate* best = pickBest(m_state.candidates);
    if (!best) {
        finishTurn();
        return StepStatus::TurnFinished;
    }
    return execute(*best);
}

TurnSummary TurnOrchestrator::runTurn(int playerId) {
    if (!beginTurn(playerId)) {
        return m_summary;
    }
    for (;;) {
        const StepStatus status = step();
        if (status == StepStatus::TurnFinished || status == StepStatus::Idle) {
            break;
        }
        if (status == StepStatus::AwaitingBattle) {
            m_summary.suspended = true;
            break;
        }
    }
    return m_summary;
}

void TurnOrchestrator::requestCancel() {
    if (m_active) {
        m_cancelRequested = true;
    }
}

std::vector<MoveCandidate> TurnOrchestrator::collectCandidates() {
    if (!m_active) {
        return {};
    }
    m_state.frontier = m_territory.frontierRegions(m_state.playerId);
    return buildCandidates();
}

std::vector<MoveCandidate> TurnOrchestrator::buildCandidates() {
    std::vector<MoveCandidate> out;
    for (Mover* mover : m_forces.armiesOf(m_state.playerId)) {
        if (!mover || mover->movementPoints() <= 0) continue;
        if (m_state.moved.count(mover->armyId()) != 0) continue;

        MoveCandidate candidate;
        if (m_state.needsReinforcement.count(mover->armyId()) != 0 && evaluateReinforcement(*mover, candidate)) {
            out.push_back(std::move(candidate));
            continue;
        }
        if (evaluateFrontier(*mover, candidate)) {
            out.push_back(std::move(candidate));
        }
    }
    return out;
}

int TurnOrchestrator::planningHorizonFor(const Mover& mover) const {
    const int mp = std::max(0, mover.movementPoints());
    if (m_config.planningHorizon <= 0) {
        return mp;
    }
    return std::max(m_config.planningHorizon, mp);
}

bool TurnOrchestrator::evaluateReinforcement(Mover& mover, MoveCandidate& out) {
    const RegionId here = mover.currentRegion();
    const RegionId stronghold = m_territory.nearestOwnedStronghold(here, m_state.playerId);
    if (stronghold == kNoRegion || stronghold == here) {
        return false;
    }
    const PathResult route = m_planner.shortestPath(here, stronghold, m_state.playerId);
    if (!route.success || route.path.size() < 2) {
        return false;
    }
    out.mover = &mover;
    out.target = stronghold;
    out.path = route.path;
    out.mpCost = route.cost;
    out.finalScore = kForcedScore;
    out.canReachNow = route.cost <= mover.movementPoints();
    out.goal = GoalTag::Reinforce;
    return true;
}

bool TurnOrchestrator::evaluateFrontier(Mover& mover, MoveCandidate& out) {
    const RegionId here = mover.currentRegion();
    const ReachabilitySet reach = m_planner.reachableRegions(here, m_state.playerId, planningHorizonFor(mover));
    if (reach.empty()) {
        return false;
    }

    const int mp = mover.movementPoints();
    bool found = false;
    for (RegionId target : m_state.frontier) {
        if (target == here || !reach.contains(target)) continue;
        const int cost = reach.costTo(target);
        const bool reachNow = cost <= mp;
        // Targets reachable this turn always beat multi-turn targets.
        if (found && out.canReachNow && !reachNow) continue;

        const double score = m_scorer.finalScore(mover.armyId(), target, cost);
        const bool promotes = found && reachNow && !out.canReachNow;
        if (found && !promotes && score <= out.finalScore) continue;

        std::vector<RegionId> path = reach.pathTo(target);
        if (path.size() < 2) continue;

        out.mover = &mover;
        out.target = target;
        out.path = std::move(path);
        out.mpCost = cost;
        out.finalScore = score;
        out.canReachNow = reachNow;
        out.goal = GoalTag::Normal;
        found = true;
    }
    return found;
}

int TurnOrchestrator::refillInPlace() {
    int count = 0;
    for (Mover* mover : m_forces.armiesOf(m_state.playerId)) {
        if (!mover || mover->movementPoints() <= 0) continue;
        const int id = mover->armyId();
        if (m_state.moved.count(id) != 0 || m_state.needsReinforcement.count(id) == 0) continue;

        const RegionId here = mover->currentRegion();
        if (m_territory.regionOwner(here) != m_state.playerId || !m_territory.regionProfile(here).stronghold) {
            continue;
        }

        m_forces.refill(*mover);
        m_state.needsReinforcement.erase(id);
        m_state.moved.insert(id);
        ++m_summary.refills;
        ++count;

        TurnEvent ev;
        ev.type = TurnEventType::ArmyReinforced;
        ev.armyId = id;
        ev.from = here;
        ev.to = here;
        ev.goal = GoalTag::Reinforce;
        emit(ev);
    }
    return count;
}

const MoveCandidate* TurnOrchestrator::pickBest(const std::vector<MoveCandidate>& candidates) const {
    const MoveCandidate* best = nullptr;
    for (const MoveCandidate& c : candidates) {
        if (!best || c.finalScore > best->finalScore) {
            best = &c;
        }
    }
    return best;
}

StepStatus TurnOrchestrator::execute(const MoveCandidate& candidate) {
    Mover& mover = *candidate.mover;
    const int playerId = m_state.playerId;
    const RegionId origin = mover.currentRegion();

    TurnEvent prepared;
    prepared.type = TurnEventType::MovePrepared;
    prepared.armyId = mover.armyId();
    prepared.from = origin;
    prepared.to = candidate.target;
    prepared.mpCost = candidate.mpCost;
    prepared.score = candidate.finalScore;
    prepared.goal = candidate.goal;
    emit(prepared);

    const std::vector<RegionId> route = m_planner.trimPathToBudget(candidate.path, playerId, mover.movementPoints());
    const int spent = route.empty() ? 0 : m_planner.pathCost(route, playerId);
    m_state.moved.insert(mover.armyId());

    if (route.size() >= 2) {
        TurnEvent started = prepared;
        started.type = TurnEventType::MoveStarted;
        started.to = route.back();
        started.mpCost = spent;
        emit(started);

        for (size_t i = 1; i < route.size(); ++i) {
            mover.relocateTo(route[i]);
        }
        mover.spendMovementPoints(spent);
        ++m_summary.movesExecuted;
    }

    const bool arrived = route.size() == candidate.path.size() && route.size() >= 2 &&
                         route.back() == candidate.target;
    if (tracing()) {
        std::cout << "[Orchestrator] army=" << mover.armyId() << " target=" << candidate.target
                  << " spent=" << spent << (arrived ? " arrived" : " partial") << std::endl;
    }
    if (!arrived || candidate.goal != GoalTag::Normal) {
        return StepStatus::MoveExecuted;
    }

    const RegionId target = candidate.target;
    const int owner = m_territory.regionOwner(target);
    const bool contested = owner != playerId &&
                           (owner != kNeutralPlayer || m_territory.regionProfile(target).defenders > 0);
    if (!contested || !m_battles.shouldTriggerBattle(mover, target)) {
        return StepStatus::MoveExecuted;
    }

    m_state.awaitingBattle = true;
    m_state.battleArmyId = mover.armyId();
    m_state.battleRegion = target;
    ++m_summary.battlesStarted;

    TurnEvent battle;
    battle.type = TurnEventType::BattleStarted;
    battle.armyId = mover.armyId();
    battle.from = origin;
    battle.to = target;
    emit(battle);

    const int token = ++m_battleToken;
    m_battles.startBattle(mover, target, [this, token](BattleVerdict verdict) { onBattleVerdict(token, verdict); });

    return m_state.awaitingBattle ? StepStatus::AwaitingBattle : StepStatus::MoveExecuted;
}

void TurnOrchestrator::onBattleVerdict(int battleToken, BattleVerdict verdict) {
    if (!m_active || !m_state.awaitingBattle || battleToken != m_battleToken) {
        std::cerr << "[Orchestrator] ignoring stale battle verdict (" << battleVerdictName(verdict) << ")\n";
        return;
    }
    m_state.awaitingBattle = false;

    TurnEvent resolved;
    resolved.type = TurnEventType::BattleResolved;
    resolved.armyId = m_state.battleArmyId;
    resolved.to = m_state.battleRegion;
    resolved.verdict = verdict;
    emit(resolved);

    if (verdict == BattleVerdict::Victory) {
        m_territory.setRegionOwner(m_state.battleRegion, m_state.playerId);
        ++m_summary.regionsConquered;

        TurnEvent conquered = resolved;
        conquered.type = TurnEventType::RegionConquered;
        emit(conquered);
    }
    m_state.battleArmyId = -1;
    m_state.battleRegion = kNoRegion;
}

void TurnOrchestrator::finishTurn() {
    TurnEvent ev;
    ev.type = TurnEventType::TurnFinished;
    emit(ev);

    if (tracing()) {
        std::cout << "[Orchestrator] turn=" << m_summary.turnNumber << " finished passes=" << m_summary.passes
                  << " moves=" << m_summary.movesExecuted << " battles=" << m_summary.battlesStarted
                  << (m_summary.cancelled ? " cancelled" : "") << std::endl;
    }

    m_active = false;
    m_cancelRequested = false;
    const int turnNumber = m_state.turnNumber;
    const int playerId = m_state.playerId;
    m_state = TurnState{};
    m_state.turnNumber = turnNumber;
    m_state.playerId = playerId;
}

void TurnOrchestrator::emit(TurnEvent event) const {
    if (!m_onEvent) {
        return;
    }
    event.playerId = m_state.playerId;
    event.turnNumber = m_state.turnNumber;
    m_onEvent(event);
}

bool TurnOrchestrator::tracing() const {
    return m_debugEnabled || m_state.turnNumber == traceTurnNumber();
}
