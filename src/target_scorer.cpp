#include "target_scorer.h"

#include "path_planner.h"

#include <algorithm>
#include <cmath>

namespace {

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

double minMax(double value, double lo, double hi) {
    if (hi <= lo) {
        return value >= hi ? 1.0 : 0.0;
    }
    return clamp01((value - lo) / (hi - lo));
}

} // namespace

TargetScorer::TargetScorer(const TerritoryService& territory, PathPlanner& planner, const CampaignContext& ctx)
    : m_territory(territory), m_planner(planner), m_ctx(ctx) {}

double TargetScorer::populationScore(const RegionProfile& profile) const {
    // Fixed reference band so scores stay comparable over a whole session.
    const CampaignConfig::PopulationBand& band = m_ctx.config.lowestBand();
    return minMax(static_cast<double>(profile.population),
                  static_cast<double>(band.minValue),
                  static_cast<double>(band.maxValue));
}

double TargetScorer::resourceScore(const RegionProfile& profile) const {
    const CampaignConfig& cfg = m_ctx.config;

    double weighted = 0.0;
    double weightSum = 0.0;
    for (Resource::Type type : Resource::kPrimaryTypes) {
        const double w = cfg.importanceOf(type);
        weighted += w * minMax(profile.yields.getAmount(type), 0.0, cfg.maxYield(type));
        weightSum += w;
    }
    const double primary = (weightSum > 0.0) ? weighted / weightSum : 0.0;

    const double treasury = minMax(profile.yields.getAmount(Resource::Type::GOLD), 0.0,
                                   cfg.maxYield(Resource::Type::GOLD)) /
                            cfg.scoring.treasuryDivisor;

    const double share = cfg.scoring.primaryResourceShare;
    return clamp01(share * primary + (1.0 - share) * treasury);
}

double TargetScorer::levelScore(const RegionProfile& profile) const {
    const int ordinal = static_cast<int>(profile.tier);
    return clamp01(static_cast<double>(ordinal - 1) / static_cast<double>(kAdminTierCount - 1));
}

double TargetScorer::ownershipScore(int owner, int forPlayer) const {
    const CampaignConfig::Scoring& s = m_ctx.config.scoring;
    if (owner == kNeutralPlayer) {
        return s.neutralOwnershipScore;
    }
    if (owner == forPlayer) {
        return s.selfOwnershipScore;
    }
    return s.rivalOwnershipScore;
}

ScoreRecord TargetScorer::scoreRegion(RegionId region, int forPlayer) const {
    ScoreRecord record;
    record.regionId = region;
    if (region < 0 || region >= m_territory.regionCount()) {
        return record;
    }

    const RegionProfile& profile = m_territory.regionProfile(region);
    const CampaignConfig::Scoring& s = m_ctx.config.scoring;
    record.populationScore = populationScore(profile);
    record.resourceScore = resourceScore(profile);
    record.levelScore = levelScore(profile);
    record.ownershipScore = ownershipScore(m_territory.regionOwner(region), forPlayer);
    record.overallScore = record.populationScore * s.populationWeight +
                          record.resourceScore * s.resourceWeight +
                          record.levelScore * s.levelWeight +
                          record.ownershipScore * s.ownershipWeight;
    return record;
}

double TargetScorer::scoreRegionBase(RegionId region) const {
    if (region < 0 || region >= m_territory.regionCount()) {
        return 0.0;
    }
    const RegionProfile& profile = m_territory.regionProfile(region);
    const CampaignConfig::Scoring& s = m_ctx.config.scoring;
    const double weightSum = s.populationWeight + s.resourceWeight + s.levelWeight;
    if (weightSum <= 0.0) {
        return 0.0;
    }
    const double sum = populationScore(profile) * s.populationWeight +
                       resourceScore(profile) * s.resourceWeight +
                       levelScore(profile) * s.levelWeight;
    return 100.0 * sum / weightSum;
}

std::vector<ScoreRecord> TargetScorer::rank(const std::vector<RegionId>& regionIds, int forPlayer) const {
    std::vector<ScoreRecord> records;
    records.reserve(regionIds.size());
    for (RegionId id : regionIds) {
        records.push_back(scoreRegion(id, forPlayer));
    }
    std::sort(records.begin(), records.end(), [](const ScoreRecord& a, const ScoreRecord& b) {
        if (a.overallScore != b.overallScore) return a.overallScore > b.overallScore;
        return a.regionId < b.regionId;
    });
    return records;
}

double TargetScorer::jitter(int armyId, RegionId region) const {
    const double amplitude = m_ctx.config.scoring.jitterAmplitude;
    if (amplitude <= 0.0) {
        return 0.0;
    }
    const std::uint64_t regionSalt = static_cast<std::uint64_t>(static_cast<std::int64_t>(region) + 1) * 0xD1B54A32D192ED03ull;
    const std::uint64_t bits = CampaignContext::mix64(m_ctx.seedForArmy(armyId) ^ regionSalt);
    return (CampaignContext::u01FromU64(bits) * 2.0 - 1.0) * amplitude;
}

double TargetScorer::finalScore(int armyId, RegionId region, int mpCost) const {
    return scoreRegionBase(region) + jitter(armyId, region) - static_cast<double>(mpCost);
}

ArmyTargetScore TargetScorer::scoreForArmy(const Mover& army, RegionId region) {
    ArmyTargetScore out;
    const PathResult route = m_planner.shortestPath(army.currentRegion(), region, army.playerId());
    if (!route.success) {
        return out;
    }
    out.reachable = true;
    out.path = route.path;
    out.pathCost = route.cost;
    out.baseScore = scoreRegionBase(region);
    out.jitter = jitter(army.armyId(), region);
    out.score = out.baseScore + out.jitter - static_cast<double>(route.cost);
    return out;
}
