#pragma once

#include <vector>

#include "campaign_context.h"
#include "campaign_services.h"

class PathPlanner;

struct ScoreRecord {
    RegionId regionId = kNoRegion;
    double populationScore = 0.0; // 0..1
    double resourceScore = 0.0;   // 0..1
    double levelScore = 0.0;      // 0..1
    double ownershipScore = 0.0;  // 0..1
    double overallScore = 0.0;    // weighted sum of the above
};

struct ArmyTargetScore {
    bool reachable = false; // false: no path exists, `score` is meaningless
    double score = 0.0;     // base + jitter - pathCost
    double baseScore = 0.0;
    double jitter = 0.0;
    int pathCost = 0;
    std::vector<RegionId> path;
};

class TargetScorer {
public:
    TargetScorer(const TerritoryService& territory, PathPlanner& planner, const CampaignContext& ctx);

    ScoreRecord scoreRegion(RegionId region, int forPlayer) const;
    // Ownership-free score rescaled to 0..100, for ranking targets independent of a mover.
    double scoreRegionBase(RegionId region) const;
    // Descending by overall score; equal scores keep ascending region id.
    std::vector<ScoreRecord> rank(const std::vector<RegionId>& regionIds, int forPlayer) const;

    ArmyTargetScore scoreForArmy(const Mover& army, RegionId region);
    double jitter(int armyId, RegionId region) const;
    double finalScore(int armyId, RegionId region, int mpCost) const;

    double populationScore(const RegionProfile& profile) const;
    double resourceScore(const RegionProfile& profile) const;
    double levelScore(const RegionProfile& profile) const;
    double ownershipScore(int owner, int forPlayer) const;

private:
    const TerritoryService& m_territory;
    PathPlanner& m_planner;
    const CampaignContext& m_ctx;
};
