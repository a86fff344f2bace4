#pragma once

#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "resource.h"

// Region ids are small dense integers in [0, regionCount).
using RegionId = int;

constexpr RegionId kNoRegion = -1;
constexpr int kNeutralPlayer = -1;

// Enter-cost sentinel. An edge into a region with this cost does not exist for the mover.
constexpr int kImpassableCost = std::numeric_limits<int>::max();

enum class AdminTier {
    Hamlet = 1,
    Village = 2,
    Town = 3,
    City = 4,
    Capital = 5
};

constexpr int kAdminTierCount = 5;

const char* adminTierName(AdminTier tier);
bool adminTierFromOrdinal(int ordinal, AdminTier& out);

struct RegionProfile {
    std::string name;
    std::string terrain;
    long long population = 0;
    AdminTier tier = AdminTier::Hamlet;
    ResourceYield yields;
    int baseEnterCost = 1;
    bool impassable = false;
    int defenders = 0;
    bool stronghold = false;
};

// Read/write view of the region graph and its ownership.
class TerritoryService {
public:
    virtual ~TerritoryService() = default;

    virtual int regionCount() const = 0;
    virtual const std::vector<RegionId>& neighborRegions(RegionId id) const = 0;
    virtual int regionOwner(RegionId id) const = 0;
    // Regions adjacent to any region owned by `playerId` but not owned by it. Sorted by id.
    virtual std::vector<RegionId> frontierRegions(int playerId) const = 0;
    // MP needed to step into `id`, or kImpassableCost.
    virtual int enterCost(RegionId id, int playerId) const = 0;
    virtual RegionId nearestOwnedStronghold(RegionId from, int playerId) const = 0;
    virtual const RegionProfile& regionProfile(RegionId id) const = 0;
    virtual void setRegionOwner(RegionId id, int playerId) = 0;
};

class Mover {
public:
    virtual ~Mover() = default;

    // Stable identifier; never reused for another army within a session.
    virtual int armyId() const = 0;
    virtual const std::string& name() const = 0;
    virtual int playerId() const = 0;
    virtual RegionId currentRegion() const = 0;
    virtual int movementPoints() const = 0;
    virtual void spendMovementPoints(int cost) = 0;
    virtual void relocateTo(RegionId id) = 0;
};

enum class BattleVerdict {
    Victory,
    Defeat,
    Draw
};

const char* battleVerdictName(BattleVerdict verdict);

using BattleCallback = std::function<void(BattleVerdict)>;

class BattleService {
public:
    virtual ~BattleService() = default;

    virtual bool shouldTriggerBattle(const Mover& mover, RegionId region) const = 0;
    // `onVerdict` must be called exactly once, either before returning or later.
    virtual void startBattle(Mover& mover, RegionId region, BattleCallback onVerdict) = 0;
};

// Army roster plus the reinforcement and turn-start policies that go with it.
class ForceService {
public:
    virtual ~ForceService() = default;

    // Armies of `playerId` in a stable order (ascending army id).
    virtual std::vector<Mover*> armiesOf(int playerId) = 0;
    virtual bool needsReinforcement(const Mover& mover) const = 0;
    virtual void refill(Mover& mover) = 0;
    virtual void allocateTurnStart(int playerId) = 0;
};
