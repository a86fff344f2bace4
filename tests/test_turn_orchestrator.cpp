#include <catch2/catch.hpp>

#include <cmath>
#include <map>
#include <vector>

#include "test_fixtures.h"

using campaign_test::addRegion;
using campaign_test::CampaignFixture;

TEST_CASE("Frontier region beyond the army's MP yields no candidate", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId far = addRegion(f.map, "far", 5);
    f.map.connect(home, far);
    Army* army = f.roster.addArmy(1, "Guard", 0, home, 3, 50);

    const TurnSummary summary = f.orchestrator.runTurn(0);
    REQUIRE(summary.passes == 1);
    REQUIRE(summary.movesExecuted == 0);
    REQUIRE_FALSE(summary.suspended);
    REQUIRE(army->currentRegion() == home);
    REQUIRE(army->movementPoints() == 3);
    REQUIRE(f.events.size() == 2);
    REQUIRE(f.events.front().type == TurnEventType::TurnStarted);
    REQUIRE(f.events.back().type == TurnEventType::TurnFinished);
    REQUIRE_FALSE(f.orchestrator.isTurnActive());
}

TEST_CASE("Player without a frontier finishes on the first pass", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId a = addRegion(f.map, "a", 1, 0);
    const RegionId b = addRegion(f.map, "b", 1, 0);
    f.map.connect(a, b);
    f.roster.addArmy(1, "Idle", 0, a, 5, 50);

    const TurnSummary summary = f.orchestrator.runTurn(0);
    REQUIRE(summary.passes == 1);
    REQUIRE(summary.movesExecuted == 0);
}

TEST_CASE("Uncontested neutral region is entered without a battle", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId open = addRegion(f.map, "open", 2);
    f.map.connect(home, open);
    Army* army = f.roster.addArmy(1, "Scouts", 0, home, 5, 50);

    const TurnSummary summary = f.orchestrator.runTurn(0);
    REQUIRE(summary.movesExecuted == 1);
    REQUIRE(summary.battlesStarted == 0);
    REQUIRE(army->currentRegion() == open);
    REQUIRE(army->movementPoints() == 3);
    REQUIRE(f.map.regionOwner(open) == kNeutralPlayer);
    REQUIRE(f.countEvents(TurnEventType::MovePrepared) == 1);
    REQUIRE(f.countEvents(TurnEventType::MoveStarted) == 1);
    REQUIRE(f.countEvents(TurnEventType::BattleStarted) == 0);
}

TEST_CASE("Victory over a rival garrison transfers ownership", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId keep = addRegion(f.map, "keep", 2, 1);
    f.map.getProfileMutable(keep).defenders = 10;
    f.map.connect(home, keep);
    Army* army = f.roster.addArmy(1, "Host", 0, home, 5, 50);

    const TurnSummary summary = f.orchestrator.runTurn(0);
    REQUIRE(summary.battlesStarted == 1);
    REQUIRE(summary.regionsConquered == 1);
    REQUIRE(f.map.regionOwner(keep) == 0);
    REQUIRE(f.map.regionProfile(keep).defenders == 0);
    REQUIRE(army->getStrength() == 40);

    std::vector<TurnEventType> battleEvents;
    for (const TurnEvent& ev : f.events) {
        if (ev.type == TurnEventType::BattleStarted || ev.type == TurnEventType::BattleResolved ||
            ev.type == TurnEventType::RegionConquered) {
            battleEvents.push_back(ev.type);
            REQUIRE(ev.to == keep);
            REQUIRE(ev.armyId == 1);
        }
    }
    REQUIRE(battleEvents == std::vector<TurnEventType>{TurnEventType::BattleStarted,
                                                       TurnEventType::BattleResolved,
                                                       TurnEventType::RegionConquered});
}

TEST_CASE("Defeat leaves ownership unchanged", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId keep = addRegion(f.map, "keep", 2, 1);
    f.map.getProfileMutable(keep).defenders = 30;
    f.map.connect(home, keep);
    Army* army = f.roster.addArmy(1, "Levy", 0, home, 5, 10);

    const TurnSummary summary = f.orchestrator.runTurn(0);
    REQUIRE(summary.battlesStarted == 1);
    REQUIRE(summary.regionsConquered == 0);
    REQUIRE(f.map.regionOwner(keep) == 1);
    REQUIRE(f.map.regionProfile(keep).defenders == 20);
    REQUIRE(army->getStrength() == 0);
    REQUIRE(f.countEvents(TurnEventType::BattleResolved) == 1);
    REQUIRE(f.countEvents(TurnEventType::RegionConquered) == 0);
}

TEST_CASE("Deferred battle suspends the turn until the verdict arrives", "[turn_orchestrator]") {
    CampaignFixture f;
    f.battles.setDeferred(true);
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId keep = addRegion(f.map, "keep", 2, 1);
    f.map.getProfileMutable(keep).defenders = 5;
    f.map.connect(home, keep);
    f.roster.addArmy(1, "Host", 0, home, 5, 50);

    const TurnSummary summary = f.orchestrator.runTurn(0);
    REQUIRE(summary.suspended);
    REQUIRE(f.orchestrator.isTurnActive());
    REQUIRE(f.orchestrator.state().awaitingBattle);
    REQUIRE(f.battles.hasPending());

    // Nothing advances while the verdict is outstanding.
    REQUIRE(f.orchestrator.step() == StepStatus::AwaitingBattle);
    REQUIRE(f.orchestrator.step() == StepStatus::AwaitingBattle);
    REQUIRE(f.map.regionOwner(keep) == 1);

    REQUIRE(f.battles.resolvePending() == 1);
    REQUIRE_FALSE(f.orchestrator.state().awaitingBattle);
    REQUIRE(f.map.regionOwner(keep) == 0);

    REQUIRE(f.orchestrator.step() == StepStatus::TurnFinished);
    REQUIRE(f.orchestrator.summary().regionsConquered == 1);
    REQUIRE(f.orchestrator.step() == StepStatus::Idle);
}

TEST_CASE("Partial movement never triggers combat", "[turn_orchestrator]") {
    CampaignFixture f(0.0, 10);
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId keep = addRegion(f.map, "keep", 6, 1);
    f.map.getProfileMutable(keep).defenders = 1;
    f.map.connect(home, keep);
    Army* army = f.roster.addArmy(1, "Host", 0, home, 3, 50);

    const std::vector<MoveCandidate> none = f.orchestrator.collectCandidates();
    REQUIRE(none.empty());

    REQUIRE(f.orchestrator.beginTurn(0));
    const std::vector<MoveCandidate> candidates = f.orchestrator.collectCandidates();
    REQUIRE(candidates.size() == 1);
    REQUIRE(candidates[0].target == keep);
    REQUIRE_FALSE(candidates[0].canReachNow);
    REQUIRE(candidates[0].mpCost == 6);

    REQUIRE(f.orchestrator.step() == StepStatus::MoveExecuted);
    REQUIRE(f.orchestrator.step() == StepStatus::TurnFinished);
    REQUIRE(f.orchestrator.summary().battlesStarted == 0);
    REQUIRE(army->currentRegion() == home);
    REQUIRE(f.map.regionOwner(keep) == 1);
    REQUIRE(f.countEvents(TurnEventType::MovePrepared) == 1);
    REQUIRE(f.countEvents(TurnEventType::MoveStarted) == 0);
}

TEST_CASE("Targets reachable this turn beat better multi-turn targets", "[turn_orchestrator]") {
    CampaignFixture f(0.0, 12);
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId hamlet = addRegion(f.map, "hamlet", 2, kNeutralPlayer, 50, AdminTier::Hamlet);
    const RegionId capital = addRegion(f.map, "capital", 6, kNeutralPlayer, 100000, AdminTier::Capital);
    f.map.connect(home, hamlet);
    f.map.connect(home, capital);
    f.roster.addArmy(1, "Riders", 0, home, 3, 50);

    REQUIRE(f.orchestrator.beginTurn(0));
    const std::vector<MoveCandidate> candidates = f.orchestrator.collectCandidates();
    REQUIRE(candidates.size() == 1);
    REQUIRE(candidates[0].target == hamlet);
    REQUIRE(candidates[0].canReachNow);
    REQUIRE(f.scorer.scoreRegionBase(capital) - 6.0 > f.scorer.scoreRegionBase(hamlet) - 2.0);
}

TEST_CASE("Best candidate wins and equal scores go to the first army", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId town = addRegion(f.map, "town", 2, kNeutralPlayer, 2000, AdminTier::Town);
    const RegionId hamlet = addRegion(f.map, "hamlet", 2);
    f.map.connect(home, town);
    f.map.connect(home, hamlet);
    f.roster.addArmy(7, "Second", 0, home, 4, 50);
    f.roster.addArmy(3, "First", 0, home, 4, 50);

    REQUIRE(f.orchestrator.beginTurn(0));
    const std::vector<MoveCandidate> candidates = f.orchestrator.collectCandidates();
    REQUIRE(candidates.size() == 2);
    REQUIRE(candidates[0].mover->armyId() == 3);
    REQUIRE(candidates[0].target == town);
    REQUIRE(candidates[1].target == town);
    REQUIRE(candidates[0].finalScore == candidates[1].finalScore);

    REQUIRE(f.orchestrator.step() == StepStatus::MoveExecuted);
    REQUIRE(f.events.back().type == TurnEventType::MoveStarted);
    REQUIRE(f.events.back().armyId == 3);
    REQUIRE(f.events.back().to == town);
}

TEST_CASE("Weakened army detours to the nearest stronghold", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId fort = addRegion(f.map, "fort", 1, 0);
    const RegionId field = addRegion(f.map, "field", 1, 0);
    const RegionId prize = addRegion(f.map, "prize", 1, kNeutralPlayer, 100000, AdminTier::Capital);
    f.map.getProfileMutable(fort).stronghold = true;
    f.map.connect(fort, field);
    f.map.connect(field, prize);
    Army* army = f.roster.addArmy(1, "Remnant", 0, field, 5, 100);
    army->setStrength(10);

    SECTION("forced candidate overrides the frontier") {
        REQUIRE(f.orchestrator.beginTurn(0));
        const std::vector<MoveCandidate> candidates = f.orchestrator.collectCandidates();
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].goal == GoalTag::Reinforce);
        REQUIRE(candidates[0].target == fort);
        REQUIRE(std::isinf(candidates[0].finalScore));
        REQUIRE(candidates[0].canReachNow);
    }

    SECTION("detour this turn, refill in place the next") {
        const TurnSummary first = f.orchestrator.runTurn(0);
        REQUIRE(first.movesExecuted == 1);
        REQUIRE(army->currentRegion() == fort);
        REQUIRE(army->getStrength() == 10);
        REQUIRE(f.map.regionOwner(prize) == kNeutralPlayer);

        const TurnSummary second = f.orchestrator.runTurn(0);
        REQUIRE(second.refills == 1);
        REQUIRE(second.movesExecuted == 0);
        REQUIRE(army->getStrength() == 100);
        REQUIRE(army->movementPoints() == 0);
        REQUIRE(army->currentRegion() == fort);
        REQUIRE(f.countEvents(TurnEventType::ArmyReinforced) == 1);
    }
}

TEST_CASE("Weakened army without a stronghold falls back to normal targets", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId open = addRegion(f.map, "open", 2);
    f.map.connect(home, open);
    Army* army = f.roster.addArmy(1, "Remnant", 0, home, 5, 100);
    army->setStrength(5);

    REQUIRE(f.orchestrator.beginTurn(0));
    const std::vector<MoveCandidate> candidates = f.orchestrator.collectCandidates();
    REQUIRE(candidates.size() == 1);
    REQUIRE(candidates[0].goal == GoalTag::Normal);
    REQUIRE(candidates[0].target == open);
}

TEST_CASE("Armies without movement points are skipped", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId open = addRegion(f.map, "open", 1);
    f.map.connect(home, open);
    f.roster.addArmy(1, "Garrison", 0, home, 0, 50);

    const TurnSummary summary = f.orchestrator.runTurn(0);
    REQUIRE(summary.movesExecuted == 0);
    REQUIRE(summary.passes == 1);
}

TEST_CASE("Cancellation ends the turn at the next step boundary", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId a = addRegion(f.map, "a", 1);
    const RegionId b = addRegion(f.map, "b", 1);
    f.map.connect(home, a);
    f.map.connect(home, b);
    Army* first = f.roster.addArmy(1, "First", 0, home, 3, 50);
    Army* second = f.roster.addArmy(2, "Second", 0, home, 3, 50);

    REQUIRE(f.orchestrator.beginTurn(0));
    REQUIRE(f.orchestrator.step() == StepStatus::MoveExecuted);
    REQUIRE(first->currentRegion() != home);

    f.orchestrator.requestCancel();
    REQUIRE(f.orchestrator.step() == StepStatus::TurnFinished);
    REQUIRE(f.orchestrator.summary().cancelled);
    REQUIRE(f.orchestrator.summary().movesExecuted == 1);
    REQUIRE(second->currentRegion() == home);
    REQUIRE(second->movementPoints() == 3);
    REQUIRE(f.events.back().type == TurnEventType::TurnFinished);
}

TEST_CASE("Cancellation waits for an outstanding battle", "[turn_orchestrator]") {
    CampaignFixture f;
    f.battles.setDeferred(true);
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId keep = addRegion(f.map, "keep", 1, 1);
    f.map.connect(home, keep);
    f.roster.addArmy(1, "Host", 0, home, 3, 50);

    REQUIRE(f.orchestrator.beginTurn(0));
    REQUIRE(f.orchestrator.step() == StepStatus::AwaitingBattle);
    f.orchestrator.requestCancel();
    REQUIRE(f.orchestrator.step() == StepStatus::AwaitingBattle);

    f.battles.resolvePending();
    REQUIRE(f.map.regionOwner(keep) == 0);
    REQUIRE(f.orchestrator.step() == StepStatus::TurnFinished);
    REQUIRE(f.orchestrator.summary().cancelled);
}

TEST_CASE("A second turn cannot start while one is in progress", "[turn_orchestrator]") {
    CampaignFixture f;
    const RegionId home = addRegion(f.map, "home", 1, 0);
    const RegionId open = addRegion(f.map, "open", 1);
    f.map.connect(home, open);
    f.roster.addArmy(1, "Host", 0, home, 3, 50);

    REQUIRE(f.orchestrator.step() == StepStatus::Idle);
    REQUIRE(f.orchestrator.beginTurn(0));
    REQUIRE_FALSE(f.orchestrator.beginTurn(1));
    REQUIRE(f.orchestrator.state().playerId == 0);
    REQUIRE(f.countEvents(TurnEventType::TurnStarted) == 1);
}

TEST_CASE("Turns terminate and move each army at most once", "[turn_orchestrator]") {
    CampaignFixture f(2.0, 8);
    const int width = 6;
    for (int i = 0; i < width * width; ++i) {
        const int owner = (i == 0) ? 0 : (i == width * width - 1) ? 1 : kNeutralPlayer;
        const RegionId id = addRegion(f.map, "cell" + std::to_string(i), 1 + (i * 3) % 4, owner,
                                      100 + 37 * i, AdminTier::Village);
        f.map.getProfileMutable(id).defenders = (i % 5 == 0) ? 8 : 0;
    }
    for (int y = 0; y < width; ++y) {
        for (int x = 0; x < width; ++x) {
            const int i = y * width + x;
            if (x + 1 < width) f.map.connect(i, i + 1);
            if (y + 1 < width) f.map.connect(i, i + width);
        }
    }
    f.roster.addArmy(1, "North", 0, 0, 4, 40);
    f.roster.addArmy(2, "South", 0, 0, 6, 40);
    f.roster.addArmy(3, "East", 1, width * width - 1, 5, 40);

    for (int round = 0; round < 6; ++round) {
        for (int player : {0, 1}) {
            f.events.clear();
            const TurnSummary summary = f.orchestrator.runTurn(player);
            REQUIRE_FALSE(summary.suspended);
            REQUIRE_FALSE(f.orchestrator.isTurnActive());
            REQUIRE(summary.passes <= 3);

            std::map<int, int> movesPerArmy;
            for (const TurnEvent& ev : f.events) {
                if (ev.type == TurnEventType::MoveStarted) {
                    ++movesPerArmy[ev.armyId];
                }
            }
            for (const auto& kv : movesPerArmy) {
                REQUIRE(kv.second == 1);
            }
        }
    }
}
