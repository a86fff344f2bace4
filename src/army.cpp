#include "army.h"

#include <algorithm>

Army::Army(int armyId,
           const std::string& name,
           int playerId,
           RegionId region,
           int maxMovementPoints,
           int fullStrength)
    : m_armyId(armyId),
      m_name(name),
      m_playerId(playerId),
      m_region(region),
      m_maxMovementPoints(std::max(0, maxMovementPoints)),
      m_movementPoints(std::max(0, maxMovementPoints)),
      m_fullStrength(std::max(1, fullStrength)),
      m_strength(std::max(1, fullStrength)) {}

void Army::spendMovementPoints(int cost) {
    m_movementPoints = std::max(0, m_movementPoints - std::max(0, cost));
}

void Army::relocateTo(RegionId id) {
    if (id == m_region) {
        return;
    }
    m_region = id;
    m_route.push_back(id);
}

void Army::setStrength(int strength) {
    m_strength = std::clamp(strength, 0, m_fullStrength);
}

ArmyRoster::ArmyRoster(double reinforcementThreshold)
    : m_reinforcementThreshold(std::clamp(reinforcementThreshold, 0.0, 1.0)) {}

Army* ArmyRoster::addArmy(int armyId,
                          const std::string& name,
                          int playerId,
                          RegionId region,
                          int maxMovementPoints,
                          int fullStrength) {
    if (findArmy(armyId)) {
        return nullptr;
    }
    auto army = std::make_unique<Army>(armyId, name, playerId, region, maxMovementPoints, fullStrength);
    Army* raw = army.get();
    const auto pos = std::lower_bound(m_armies.begin(), m_armies.end(), armyId,
                                      [](const std::unique_ptr<Army>& a, int id) { return a->armyId() < id; });
    m_armies.insert(pos, std::move(army));
    return raw;
}

Army* ArmyRoster::findArmy(int armyId) {
    for (auto& a : m_armies) {
        if (a->armyId() == armyId) {
            return a.get();
        }
    }
    return nullptr;
}

const Army* ArmyRoster::findArmy(int armyId) const {
    for (const auto& a : m_armies) {
        if (a->armyId() == armyId) {
            return a.get();
        }
    }
    return nullptr;
}

std::vector<int> ArmyRoster::players() const {
    std::vector<int> out;
    for (const auto& a : m_armies) {
        out.push_back(a->playerId());
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<Mover*> ArmyRoster::armiesOf(int playerId) {
    std::vector<Mover*> out;
    for (auto& a : m_armies) {
        if (a->playerId() == playerId) {
            out.push_back(a.get());
        }
    }
    return out;
}

bool ArmyRoster::needsReinforcement(const Mover& mover) const {
    const Army* army = findArmy(mover.armyId());
    if (!army) {
        return false;
    }
    return static_cast<double>(army->getStrength()) <
           m_reinforcementThreshold * static_cast<double>(army->getFullStrength());
}

void ArmyRoster::refill(Mover& mover) {
    Army* army = findArmy(mover.armyId());
    if (!army) {
        return;
    }
    army->setStrength(army->getFullStrength());
    army->spendMovementPoints(army->movementPoints());
}

void ArmyRoster::allocateTurnStart(int playerId) {
    for (auto& a : m_armies) {
        if (a->playerId() == playerId) {
            a->restoreMovementPoints();
        }
    }
}
