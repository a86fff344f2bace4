#pragma once

#include <vector>

#include "army.h"
#include "campaign_services.h"
#include "world_map.h"

// Compares attacker strength against the region's garrison. Verdicts are delivered
// immediately unless deferred mode is on, in which case they wait for resolvePending().
class GarrisonBattleResolver : public BattleService {
public:
    GarrisonBattleResolver(WorldMap& map, ArmyRoster& roster);

    bool shouldTriggerBattle(const Mover& mover, RegionId region) const override;
    void startBattle(Mover& mover, RegionId region, BattleCallback onVerdict) override;

    void setDeferred(bool deferred) { m_deferred = deferred; }
    bool isDeferred() const { return m_deferred; }
    bool hasPending() const { return !m_pending.empty(); }
    // Resolves every held battle in start order. Returns the number resolved.
    int resolvePending();

    int battlesFought() const { return m_battlesFought; }

private:
    struct PendingBattle {
        int armyId = 0;
        RegionId region = kNoRegion;
        BattleCallback onVerdict;
    };

    BattleVerdict resolve(int armyId, RegionId region);

    WorldMap& m_map;
    ArmyRoster& m_roster;
    bool m_deferred = false;
    std::vector<PendingBattle> m_pending;
    int m_battlesFought = 0;
};
