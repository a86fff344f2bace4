#pragma once

#include <memory>
#include <string>
#include <vector>

#include "campaign_services.h"

class Army : public Mover {
public:
    Army(int armyId,
         const std::string& name,
         int playerId,
         RegionId region,
         int maxMovementPoints,
         int fullStrength);

    int armyId() const override { return m_armyId; }
    const std::string& name() const override { return m_name; }
    int playerId() const override { return m_playerId; }
    RegionId currentRegion() const override { return m_region; }
    int movementPoints() const override { return m_movementPoints; }
    void spendMovementPoints(int cost) override;
    void relocateTo(RegionId id) override;

    int getMaxMovementPoints() const { return m_maxMovementPoints; }
    void restoreMovementPoints() { m_movementPoints = m_maxMovementPoints; }
    int getStrength() const { return m_strength; }
    int getFullStrength() const { return m_fullStrength; }
    void setStrength(int strength);
    void setPlayerId(int playerId) { m_playerId = playerId; }
    // Regions entered since construction, in order.
    const std::vector<RegionId>& getRoute() const { return m_route; }

private:
    int m_armyId;
    std::string m_name;
    int m_playerId;
    RegionId m_region;
    int m_maxMovementPoints;
    int m_movementPoints;
    int m_fullStrength;
    int m_strength;
    std::vector<RegionId> m_route;
};

class ArmyRoster : public ForceService {
public:
    explicit ArmyRoster(double reinforcementThreshold = 0.5);

    // Returns nullptr if `armyId` is already taken.
    Army* addArmy(int armyId,
                  const std::string& name,
                  int playerId,
                  RegionId region,
                  int maxMovementPoints,
                  int fullStrength);
    Army* findArmy(int armyId);
    const Army* findArmy(int armyId) const;
    const std::vector<std::unique_ptr<Army>>& getArmies() const { return m_armies; }
    // Players owning at least one army, ascending.
    std::vector<int> players() const;

    // ForceService
    std::vector<Mover*> armiesOf(int playerId) override;
    bool needsReinforcement(const Mover& mover) const override;
    // Restores full strength; the refill uses up the army's remaining MP.
    void refill(Mover& mover) override;
    void allocateTurnStart(int playerId) override;

private:
    double m_reinforcementThreshold;
    std::vector<std::unique_ptr<Army>> m_armies; // ascending army id
};
