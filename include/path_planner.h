#pragma once

#include <cstdint>
#include <limits>
#include <vector>

#include "campaign_context.h"
#include "campaign_services.h"
#include "priority_queue.h"

constexpr int kUnboundedHorizon = std::numeric_limits<int>::max();

struct PathResult {
    bool success = false;
    std::vector<RegionId> path; // start..target inclusive
    int cost = 0;
};

// Regions reachable from one start within a horizon, as dense per-region arrays.
class ReachabilitySet {
public:
    ReachabilitySet() = default;

    bool contains(RegionId id) const;
    // -1 when `id` is not in the set.
    int costTo(RegionId id) const;
    RegionId parentOf(RegionId id) const;
    // Empty when `id` is not in the set or its parent chain is malformed.
    std::vector<RegionId> pathTo(RegionId id) const;
    // Members in ascending id order.
    std::vector<RegionId> regions() const;

    std::size_t size() const { return m_count; }
    bool empty() const { return m_count == 0; }
    RegionId start() const { return m_start; }
    int horizon() const { return m_horizon; }
    // True when the iteration cap cut the search short; costs of the unexpanded
    // frontier are upper bounds.
    bool truncated() const { return m_truncated; }

private:
    friend class PathPlanner;

    RegionId m_start = kNoRegion;
    int m_horizon = 0;
    int m_maxPathLength = 0;
    bool m_truncated = false;
    std::size_t m_count = 0;
    std::vector<int> m_cost;
    std::vector<RegionId> m_parent;
};

class PathPlanner {
public:
    PathPlanner(const TerritoryService& territory, const CampaignConfig::Planner& config);

    // All regions whose cheapest entry cost from `start` is <= horizon.
    // A negative horizon uses the configured default.
    ReachabilitySet reachableRegions(RegionId start, int playerId, int horizon = -1);
    // Point search; stops as soon as `target` is settled.
    PathResult shortestPath(RegionId start, RegionId target, int playerId);

    std::vector<RegionId> trimPathToBudget(const std::vector<RegionId>& path, int playerId, int budget) const;
    int pathCost(const std::vector<RegionId>& path, int playerId) const;

    // Walks `parents` back from target to start. Returns an empty path for broken or
    // cyclic chains and for chains longer than maxLength.
    static std::vector<RegionId> reconstructPath(const std::vector<RegionId>& parents,
                                                 RegionId start,
                                                 RegionId target,
                                                 int maxLength);

    int lastIterations() const { return m_lastIterations; }
    bool lastSearchTruncated() const { return m_lastTruncated; }
    const CampaignConfig::Planner& config() const { return m_config; }
    void setDebugEnabled(bool enabled) { m_debugEnabled = enabled; }

private:
    bool isValidRegion(RegionId id) const;
    // Dijkstra from `start`. Fills m_dist/m_parent. Stops early when `target` is
    // settled (kNoRegion explores everything within the horizon). Returns true if the
    // target was settled.
    bool runSearch(RegionId start, RegionId target, int playerId, int horizon, int iterationCap);

    const TerritoryService& m_territory;
    CampaignConfig::Planner m_config;
    RegionPriorityQueue m_queue;

    std::vector<int> m_dist;
    std::vector<RegionId> m_parent;
    std::vector<int> m_queuedCost;
    std::vector<std::uint8_t> m_settled;

    int m_lastIterations = 0;
    bool m_lastTruncated = false;
    bool m_debugEnabled = false;
};
