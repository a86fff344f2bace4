#include "battle_resolver.h"

#include <algorithm>
#include <utility>

GarrisonBattleResolver::GarrisonBattleResolver(WorldMap& map, ArmyRoster& roster)
    : m_map(map), m_roster(roster) {}

bool GarrisonBattleResolver::shouldTriggerBattle(const Mover& mover, RegionId region) const {
    if (!m_map.isValidRegion(region)) {
        return false;
    }
    const int owner = m_map.regionOwner(region);
    if (owner == mover.playerId()) {
        return false;
    }
    return owner != kNeutralPlayer || m_map.regionProfile(region).defenders > 0;
}

void GarrisonBattleResolver::startBattle(Mover& mover, RegionId region, BattleCallback onVerdict) {
    if (m_deferred) {
        m_pending.push_back(PendingBattle{mover.armyId(), region, std::move(onVerdict)});
        return;
    }
    const BattleVerdict verdict = resolve(mover.armyId(), region);
    if (onVerdict) {
        onVerdict(verdict);
    }
}

int GarrisonBattleResolver::resolvePending() {
    // Callbacks may start new battles; those wait for the next call.
    std::vector<PendingBattle> batch;
    batch.swap(m_pending);
    for (PendingBattle& b : batch) {
        const BattleVerdict verdict = resolve(b.armyId, b.region);
        if (b.onVerdict) {
            b.onVerdict(verdict);
        }
    }
    return static_cast<int>(batch.size());
}

BattleVerdict GarrisonBattleResolver::resolve(int armyId, RegionId region) {
    ++m_battlesFought;
    Army* army = m_roster.findArmy(armyId);
    if (!army || !m_map.isValidRegion(region)) {
        return BattleVerdict::Defeat;
    }

    RegionProfile& garrison = m_map.getProfileMutable(region);
    const int attackers = army->getStrength();
    const int defenders = std::max(0, garrison.defenders);

    BattleVerdict verdict = BattleVerdict::Draw;
    if (attackers > defenders) {
        verdict = BattleVerdict::Victory;
        army->setStrength(attackers - defenders);
        garrison.defenders = 0;
    } else if (attackers < defenders) {
        verdict = BattleVerdict::Defeat;
        army->setStrength(0);
        garrison.defenders = defenders - attackers;
    } else {
        army->setStrength(0);
        garrison.defenders = 0;
    }
    return verdict;
}
