#include "world_map.h"

#include <algorithm>
#include <cstdint>
#include <queue>

WorldMap::WorldMap(const CampaignConfig& config) : m_config(config) {
    m_invalidProfile.impassable = true;
}

RegionId WorldMap::addRegion(const std::string& name, const std::string& terrainKey, int owner) {
    RegionProfile profile;
    profile.name = name;
    const CampaignConfig::TerrainArchetype* archetype = m_config.findTerrain(terrainKey);
    if (!archetype && !m_config.terrain.empty()) {
        archetype = &m_config.terrain.front();
    }
    if (archetype) {
        profile.terrain = archetype->key;
        profile.baseEnterCost = archetype->enterCost;
        profile.impassable = archetype->impassable;
        profile.yields = archetype->yields;
    }
    return addRegion(profile, owner);
}

RegionId WorldMap::addRegion(const RegionProfile& profile, int owner) {
    const RegionId id = static_cast<RegionId>(m_profiles.size());
    m_profiles.push_back(profile);
    m_profiles.back().baseEnterCost = std::max(1, profile.baseEnterCost);
    m_owner.push_back(owner);
    m_adjacency.emplace_back();
    return id;
}

bool WorldMap::connect(RegionId a, RegionId b) {
    if (!isValidRegion(a) || !isValidRegion(b) || a == b) {
        return false;
    }
    auto& na = m_adjacency[static_cast<size_t>(a)];
    if (std::find(na.begin(), na.end(), b) != na.end()) {
        return false;
    }
    na.push_back(b);
    m_adjacency[static_cast<size_t>(b)].push_back(a);
    return true;
}

bool WorldMap::isValidRegion(RegionId id) const {
    return id >= 0 && static_cast<size_t>(id) < m_profiles.size();
}

RegionProfile& WorldMap::getProfileMutable(RegionId id) {
    if (!isValidRegion(id)) {
        return m_invalidProfile;
    }
    return m_profiles[static_cast<size_t>(id)];
}

std::vector<RegionId> WorldMap::regionsOwnedBy(int playerId) const {
    std::vector<RegionId> out;
    for (size_t i = 0; i < m_owner.size(); ++i) {
        if (m_owner[i] == playerId) {
            out.push_back(static_cast<RegionId>(i));
        }
    }
    return out;
}

int WorldMap::ownedRegionCount(int playerId) const {
    return static_cast<int>(std::count(m_owner.begin(), m_owner.end(), playerId));
}

int WorldMap::regionCount() const {
    return static_cast<int>(m_profiles.size());
}

const std::vector<RegionId>& WorldMap::neighborRegions(RegionId id) const {
    if (!isValidRegion(id)) {
        return m_noNeighbors;
    }
    return m_adjacency[static_cast<size_t>(id)];
}

int WorldMap::regionOwner(RegionId id) const {
    return isValidRegion(id) ? m_owner[static_cast<size_t>(id)] : kNeutralPlayer;
}

std::vector<RegionId> WorldMap::frontierRegions(int playerId) const {
    std::vector<std::uint8_t> mark(m_profiles.size(), 0u);
    for (size_t i = 0; i < m_owner.size(); ++i) {
        if (m_owner[i] != playerId) continue;
        for (RegionId nb : m_adjacency[i]) {
            if (m_owner[static_cast<size_t>(nb)] != playerId) {
                mark[static_cast<size_t>(nb)] = 1u;
            }
        }
    }
    std::vector<RegionId> out;
    for (size_t i = 0; i < mark.size(); ++i) {
        if (mark[i] != 0u) {
            out.push_back(static_cast<RegionId>(i));
        }
    }
    return out;
}

int WorldMap::enterCost(RegionId id, int playerId) const {
    if (!isValidRegion(id)) {
        return kImpassableCost;
    }
    const RegionProfile& p = m_profiles[static_cast<size_t>(id)];
    if (p.impassable) {
        return kImpassableCost;
    }
    int cost = p.baseEnterCost;
    if (playerId != kNeutralPlayer && m_owner[static_cast<size_t>(id)] == playerId && cost > 1) {
        cost = std::max(1, cost - m_config.planner.ownedDiscount);
    }
    return cost;
}

RegionId WorldMap::nearestOwnedStronghold(RegionId from, int playerId) const {
    if (!isValidRegion(from)) {
        return kNoRegion;
    }

    struct Node {
        long long dist = 0;
        RegionId region = kNoRegion;
    };
    struct NodeCmp {
        bool operator()(const Node& a, const Node& b) const {
            if (a.dist != b.dist) return a.dist > b.dist;
            return a.region > b.region;
        }
    };

    std::vector<long long> dist(m_profiles.size(), -1);
    std::priority_queue<Node, std::vector<Node>, NodeCmp> pq;
    dist[static_cast<size_t>(from)] = 0;
    pq.push(Node{0, from});

    while (!pq.empty()) {
        const Node cur = pq.top();
        pq.pop();
        const size_t ci = static_cast<size_t>(cur.region);
        if (cur.dist > dist[ci]) continue;

        if (m_owner[ci] == playerId && m_profiles[ci].stronghold) {
            return cur.region;
        }

        for (RegionId nb : m_adjacency[ci]) {
            const int step = enterCost(nb, playerId);
            if (step == kImpassableCost) continue;
            const long long nd = cur.dist + step;
            const size_t ni = static_cast<size_t>(nb);
            if (dist[ni] < 0 || nd < dist[ni]) {
                dist[ni] = nd;
                pq.push(Node{nd, nb});
            }
        }
    }
    return kNoRegion;
}

const RegionProfile& WorldMap::regionProfile(RegionId id) const {
    if (!isValidRegion(id)) {
        return m_invalidProfile;
    }
    return m_profiles[static_cast<size_t>(id)];
}

void WorldMap::setRegionOwner(RegionId id, int playerId) {
    if (!isValidRegion(id)) {
        return;
    }
    m_owner[static_cast<size_t>(id)] = playerId;
}
