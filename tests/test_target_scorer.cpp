#include <catch2/catch.hpp>

#include <cmath>
#include <vector>

#include "path_planner.h"
#include "target_scorer.h"
#include "test_fixtures.h"

using campaign_test::addRegion;
using campaign_test::makeContext;

namespace {

// Population at the lowest band minimum, primary resources at 62.5% of the terrain
// maxima (0.5 after the treasury split), tier Town (level 0.5).
RegionProfile midpointProfile() {
    RegionProfile p;
    p.name = "Midpoint";
    p.terrain = "plains";
    p.population = 50;
    p.tier = AdminTier::Town;
    p.yields = ResourceYield(5.0, 6.25, 6.25, 0.0);
    p.baseEnterCost = 2;
    return p;
}

struct ScorerSetup {
    CampaignContext ctx;
    WorldMap map{ctx.config};
    PathPlanner planner{map, ctx.config.planner};
    TargetScorer scorer{map, planner, ctx};

    explicit ScorerSetup(double jitter = 0.0) : ctx(makeContext(jitter)) {}
};

} // namespace

TEST_CASE("Midpoint neutral region scores 0.38 overall", "[target_scorer]") {
    ScorerSetup s;
    const RegionId r = s.map.addRegion(midpointProfile());

    const ScoreRecord rec = s.scorer.scoreRegion(r, 0);
    REQUIRE(rec.regionId == r);
    REQUIRE(rec.populationScore == Approx(0.0));
    REQUIRE(rec.resourceScore == Approx(0.5));
    REQUIRE(rec.levelScore == Approx(0.5));
    REQUIRE(rec.ownershipScore == Approx(0.8));
    REQUIRE(rec.overallScore == Approx(0.38));
}

TEST_CASE("Overall score is the weighted sum of its components", "[target_scorer]") {
    ScorerSetup s;
    const CampaignConfig::Scoring& w = s.ctx.config.scoring;
    const RegionId a = addRegion(s.map, "a", 2, 1, 7000, AdminTier::City);
    const RegionId b = addRegion(s.map, "b", 3, kNeutralPlayer, 260, AdminTier::Village);
    s.map.getProfileMutable(b).yields = ResourceYield(1.0, 9.0, 4.0, 6.0);

    for (RegionId r : {a, b}) {
        const ScoreRecord rec = s.scorer.scoreRegion(r, 0);
        const double expected = rec.populationScore * w.populationWeight + rec.resourceScore * w.resourceWeight +
                                rec.levelScore * w.levelWeight + rec.ownershipScore * w.ownershipWeight;
        REQUIRE(rec.overallScore == Approx(expected));
        for (double component : {rec.populationScore, rec.resourceScore, rec.levelScore, rec.ownershipScore}) {
            REQUIRE(component >= 0.0);
            REQUIRE(component <= 1.0);
        }
    }
}

TEST_CASE("Ownership score depends on who holds the region", "[target_scorer]") {
    ScorerSetup s;
    const RegionId neutral = addRegion(s.map, "n", 2);
    const RegionId mine = addRegion(s.map, "m", 2, 0);
    const RegionId theirs = addRegion(s.map, "t", 2, 3);

    REQUIRE(s.scorer.scoreRegion(neutral, 0).ownershipScore == 0.8);
    REQUIRE(s.scorer.scoreRegion(mine, 0).ownershipScore == 0.1);
    REQUIRE(s.scorer.scoreRegion(theirs, 0).ownershipScore == 1.0);
    REQUIRE(s.scorer.scoreRegion(theirs, 3).ownershipScore == 0.1);
}

TEST_CASE("Population above the reference band saturates", "[target_scorer]") {
    ScorerSetup s;
    const RegionId small = addRegion(s.map, "small", 2, kNeutralPlayer, 275);
    const RegionId huge = addRegion(s.map, "huge", 2, kNeutralPlayer, 90000);
    const RegionId empty = addRegion(s.map, "empty", 2, kNeutralPlayer, 0);

    REQUIRE(s.scorer.scoreRegion(small, 0).populationScore == Approx(0.5));
    REQUIRE(s.scorer.scoreRegion(huge, 0).populationScore == Approx(1.0));
    REQUIRE(s.scorer.scoreRegion(empty, 0).populationScore == Approx(0.0));
}

TEST_CASE("Base score ignores ownership and spans 0..100", "[target_scorer]") {
    ScorerSetup s;
    const RegionId r = s.map.addRegion(midpointProfile(), 2);

    // (0.40 * 0.5 + 0.20 * 0.5) / 0.90
    REQUIRE(s.scorer.scoreRegionBase(r) == Approx(100.0 / 3.0));
    s.map.setRegionOwner(r, kNeutralPlayer);
    REQUIRE(s.scorer.scoreRegionBase(r) == Approx(100.0 / 3.0));
    REQUIRE(s.scorer.scoreRegionBase(42) == 0.0);
}

TEST_CASE("Ranking is descending with ties broken by region id", "[target_scorer]") {
    ScorerSetup s;
    const RegionId low = addRegion(s.map, "low", 2, kNeutralPlayer, 50, AdminTier::Hamlet);
    const RegionId twinA = addRegion(s.map, "twinA", 2, kNeutralPlayer, 500, AdminTier::City);
    const RegionId high = addRegion(s.map, "high", 2, 1, 500, AdminTier::Capital);
    const RegionId twinB = addRegion(s.map, "twinB", 2, kNeutralPlayer, 500, AdminTier::City);

    const std::vector<ScoreRecord> ranked = s.scorer.rank({twinB, low, high, twinA}, 0);
    REQUIRE(ranked.size() == 4);
    REQUIRE(ranked[0].regionId == high);
    REQUIRE(ranked[1].regionId == twinA);
    REQUIRE(ranked[2].regionId == twinB);
    REQUIRE(ranked[3].regionId == low);
}

TEST_CASE("Jitter is bounded and reproducible per army and region", "[target_scorer]") {
    ScorerSetup s(2.0);
    ScorerSetup again(2.0);
    for (RegionId r = 0; r < 20; ++r) {
        addRegion(s.map, "r", 2);
        addRegion(again.map, "r", 2);
    }

    bool anyDifferent = false;
    for (int army = 1; army <= 5; ++army) {
        for (RegionId r = 0; r < 20; ++r) {
            const double j = s.scorer.jitter(army, r);
            REQUIRE(std::fabs(j) <= 2.0);
            REQUIRE(j == again.scorer.jitter(army, r));
            if (j != s.scorer.jitter(army + 1, r)) {
                anyDifferent = true;
            }
        }
    }
    REQUIRE(anyDifferent);

    ScorerSetup flat(0.0);
    REQUIRE(flat.scorer.jitter(1, 0) == 0.0);
}

TEST_CASE("Army score combines base score, jitter and path cost", "[target_scorer]") {
    ScorerSetup s(2.0);
    const RegionId home = addRegion(s.map, "home", 2, 0);
    const RegionId mid = addRegion(s.map, "mid", 3);
    const RegionId goal = s.map.addRegion(midpointProfile());
    const RegionId island = addRegion(s.map, "island", 2);
    s.map.connect(home, mid);
    s.map.connect(mid, goal);

    ArmyRoster roster;
    Army* army = roster.addArmy(11, "Scouts", 0, home, 10, 50);
    REQUIRE(army != nullptr);

    const ArmyTargetScore score = s.scorer.scoreForArmy(*army, goal);
    REQUIRE(score.reachable);
    REQUIRE(score.pathCost == 5);
    REQUIRE(score.path == std::vector<RegionId>{home, mid, goal});
    REQUIRE(score.baseScore == Approx(100.0 / 3.0));
    REQUIRE(score.jitter == s.scorer.jitter(11, goal));
    REQUIRE(score.score == Approx(score.baseScore + score.jitter - 5.0));
    REQUIRE(score.score == Approx(s.scorer.finalScore(11, goal, 5)));

    REQUIRE_FALSE(s.scorer.scoreForArmy(*army, island).reachable);
}
