#pragma once

#include <string>
#include <vector>

#include "campaign_context.h"
#include "campaign_services.h"

// In-memory region graph with ownership. Region ids are assigned densely in insertion order.
class WorldMap : public TerritoryService {
public:
    explicit WorldMap(const CampaignConfig& config);

    // Fills cost and yields from the terrain archetype. Unknown terrain falls back to the
    // first archetype in the config.
    RegionId addRegion(const std::string& name, const std::string& terrainKey, int owner = kNeutralPlayer);
    RegionId addRegion(const RegionProfile& profile, int owner = kNeutralPlayer);
    // Undirected edge. Self-loops, duplicates and invalid ids are rejected.
    bool connect(RegionId a, RegionId b);

    bool isValidRegion(RegionId id) const;
    RegionProfile& getProfileMutable(RegionId id);
    std::vector<RegionId> regionsOwnedBy(int playerId) const;
    int ownedRegionCount(int playerId) const;
    const std::vector<int>& getOwners() const { return m_owner; }
    const CampaignConfig& getConfig() const { return m_config; }

    // TerritoryService
    int regionCount() const override;
    const std::vector<RegionId>& neighborRegions(RegionId id) const override;
    int regionOwner(RegionId id) const override;
    std::vector<RegionId> frontierRegions(int playerId) const override;
    int enterCost(RegionId id, int playerId) const override;
    RegionId nearestOwnedStronghold(RegionId from, int playerId) const override;
    const RegionProfile& regionProfile(RegionId id) const override;
    void setRegionOwner(RegionId id, int playerId) override;

private:
    const CampaignConfig& m_config;
    std::vector<RegionProfile> m_profiles;
    std::vector<int> m_owner;
    std::vector<std::vector<RegionId>> m_adjacency;
    std::vector<RegionId> m_noNeighbors;
    RegionProfile m_invalidProfile;
};
