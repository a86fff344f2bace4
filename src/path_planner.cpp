#include "path_planner.h"

#include <algorithm>
#include <iostream>

namespace {

constexpr int kUnreached = -1;
constexpr int kNotQueued = -1;

} // namespace

bool ReachabilitySet::contains(RegionId id) const {
    return id >= 0 && static_cast<size_t>(id) < m_cost.size() && m_cost[static_cast<size_t>(id)] != kUnreached;
}

int ReachabilitySet::costTo(RegionId id) const {
    return contains(id) ? m_cost[static_cast<size_t>(id)] : kUnreached;
}

RegionId ReachabilitySet::parentOf(RegionId id) const {
    return contains(id) ? m_parent[static_cast<size_t>(id)] : kNoRegion;
}

std::vector<RegionId> ReachabilitySet::pathTo(RegionId id) const {
    if (!contains(id)) {
        return {};
    }
    return PathPlanner::reconstructPath(m_parent, m_start, id, m_maxPathLength);
}

std::vector<RegionId> ReachabilitySet::regions() const {
    std::vector<RegionId> out;
    out.reserve(m_count);
    for (size_t i = 0; i < m_cost.size(); ++i) {
        if (m_cost[i] != kUnreached) {
            out.push_back(static_cast<RegionId>(i));
        }
    }
    return out;
}

PathPlanner::PathPlanner(const TerritoryService& territory, const CampaignConfig::Planner& config)
    : m_territory(territory), m_config(config) {}

bool PathPlanner::isValidRegion(RegionId id) const {
    return id >= 0 && id < m_territory.regionCount();
}

bool PathPlanner::runSearch(RegionId start, RegionId target, int playerId, int horizon, int iterationCap) {
    const size_t n = static_cast<size_t>(std::max(0, m_territory.regionCount()));
    m_dist.assign(n, kUnreached);
    m_parent.assign(n, kNoRegion);
    m_queuedCost.assign(n, kNotQueued);
    m_settled.assign(n, 0u);
    m_queue.clear();
    m_lastIterations = 0;
    m_lastTruncated = false;

    m_dist[static_cast<size_t>(start)] = 0;
    m_queuedCost[static_cast<size_t>(start)] = 0;
    m_queue.insert({start, 0});

    bool found = false;
    while (!m_queue.isEmpty()) {
        const QueueEntry cur = m_queue.extractMin();
        const size_t ci = static_cast<size_t>(cur.regionId);

        // Lazy deletion: settled nodes and entries superseded by a cheaper push.
        if (m_settled[ci] != 0u || m_queuedCost[ci] != cur.cost) {
            continue;
        }

        if (m_lastIterations >= iterationCap) {
            m_lastTruncated = true;
            std::cerr << "[PathPlanner] iteration cap " << iterationCap << " reached from region " << start
                      << "; returning partial result.\n";
            break;
        }
        ++m_lastIterations;

        m_settled[ci] = 1u;
        m_queuedCost[ci] = kNotQueued;
        if (cur.regionId == target) {
            found = true;
            break;
        }

        for (RegionId nb : m_territory.neighborRegions(cur.regionId)) {
            if (!isValidRegion(nb)) continue;
            const size_t ni = static_cast<size_t>(nb);
            if (m_settled[ni] != 0u) continue;

            const int step = m_territory.enterCost(nb, playerId);
            if (step == kImpassableCost || step < 0) continue;

            const long long next = static_cast<long long>(cur.cost) + static_cast<long long>(step);
            if (next > static_cast<long long>(horizon) || next >= static_cast<long long>(kImpassableCost)) continue;
            if (m_dist[ni] != kUnreached && next >= m_dist[ni]) continue;

            m_dist[ni] = static_cast<int>(next);
            m_parent[ni] = cur.regionId;
            m_queuedCost[ni] = static_cast<int>(next);
            m_queue.insert({nb, static_cast<int>(next)});
        }
    }

    if (m_debugEnabled) {
        std::cout << "[PathPlanner] search start=" << start << " target=" << target << " horizon=" << horizon
                  << " iterations=" << m_lastIterations << (found ? " found" : "")
                  << (m_lastTruncated ? " truncated" : "") << std::endl;
    }
    return found;
}

ReachabilitySet PathPlanner::reachableRegions(RegionId start, int playerId, int horizon) {
    ReachabilitySet set;
    set.m_start = start;
    set.m_horizon = (horizon < 0) ? m_config.defaultHorizon : horizon;
    set.m_maxPathLength = m_config.maxPathLength;
    if (!isValidRegion(start)) {
        return set;
    }

    runSearch(start, kNoRegion, playerId, set.m_horizon, m_config.reachableIterationCap);

    set.m_truncated = m_lastTruncated;
    set.m_cost = m_dist;
    set.m_parent = m_parent;
    set.m_count = static_cast<size_t>(std::count_if(set.m_cost.begin(), set.m_cost.end(), [](int c) {
        return c != kUnreached;
    }));
    return set;
}

PathResult PathPlanner::shortestPath(RegionId start, RegionId target, int playerId) {
    PathResult result;
    if (!isValidRegion(start) || !isValidRegion(target)) {
        return result;
    }
    if (start == target) {
        result.success = true;
        result.path.push_back(start);
        return result;
    }

    if (!runSearch(start, target, playerId, kUnboundedHorizon, m_config.shortestPathIterationCap)) {
        return result;
    }

    result.path = reconstructPath(m_parent, start, target, m_config.maxPathLength);
    if (result.path.empty()) {
        return result;
    }
    result.cost = m_dist[static_cast<size_t>(target)];
    result.success = true;
    return result;
}

std::vector<RegionId> PathPlanner::trimPathToBudget(const std::vector<RegionId>& path, int playerId, int budget) const {
    std::vector<RegionId> trimmed;
    if (path.empty()) {
        return trimmed;
    }
    trimmed.reserve(path.size());
    trimmed.push_back(path.front());

    // Costs are re-read: ownership may have changed since the path was planned.
    long long spent = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        if (!isValidRegion(path[i])) break;
        const int step = m_territory.enterCost(path[i], playerId);
        if (step == kImpassableCost || step < 0) break;
        if (spent + step > static_cast<long long>(budget)) break;
        spent += step;
        trimmed.push_back(path[i]);
    }
    return trimmed;
}

int PathPlanner::pathCost(const std::vector<RegionId>& path, int playerId) const {
    long long total = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        if (!isValidRegion(path[i])) {
            return kImpassableCost;
        }
        const int step = m_territory.enterCost(path[i], playerId);
        if (step == kImpassableCost || step < 0) {
            return kImpassableCost;
        }
        total += step;
        if (total >= static_cast<long long>(kImpassableCost)) {
            return kImpassableCost;
        }
    }
    return static_cast<int>(total);
}

std::vector<RegionId> PathPlanner::reconstructPath(const std::vector<RegionId>& parents,
                                                   RegionId start,
                                                   RegionId target,
                                                   int maxLength) {
    std::vector<RegionId> rev;
    const RegionId n = static_cast<RegionId>(parents.size());
    if (target < 0 || target >= n || start < 0 || start >= n) {
        return rev;
    }

    for (RegionId at = target; at != kNoRegion; at = parents[static_cast<size_t>(at)]) {
        if (at < 0 || at >= n) {
            return {};
        }
        rev.push_back(at);
        if (at == start) {
            break;
        }
        if (static_cast<int>(rev.size()) >= maxLength) {
            std::cerr << "[PathPlanner] parent chain from region " << target << " exceeds " << maxLength
                      << " steps; discarding path.\n";
            return {};
        }
    }
    if (rev.empty() || rev.back() != start) {
        return {};
    }
    std::reverse(rev.begin(), rev.end());
    return rev;
}
