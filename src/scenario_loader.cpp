#include "scenario_loader.h"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string_view>
#include <vector>

#include <toml++/toml.hpp>

namespace {

struct RegionEntry {
    int id = -1;
    RegionProfile profile;
    int owner = kNeutralPlayer;
    std::vector<int> neighbors;
};

struct ArmyEntry {
    int id = -1;
    std::string name;
    int owner = kNeutralPlayer;
    int region = kNoRegion;
    int movementPoints = 0;
    int strength = 100;
};

bool fail(std::string* errorMessage, const std::string& message) {
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}

int tableInt(const toml::table& t, std::string_view key, int fallback) {
    if (const auto v = t[key].value<std::int64_t>()) {
        return static_cast<int>(*v);
    }
    return fallback;
}

bool readRegions(const toml::table& root,
                 const CampaignConfig& config,
                 std::vector<RegionEntry>& out,
                 std::string* errorMessage) {
    const toml::array* regions = root["regions"].as_array();
    if (!regions || regions->empty()) {
        return fail(errorMessage, "scenario has no [[regions]]");
    }

    for (const auto& node : *regions) {
        const toml::table* t = node.as_table();
        if (!t) {
            return fail(errorMessage, "[[regions]] entries must be tables");
        }
        RegionEntry entry;
        entry.id = tableInt(*t, "id", -1);
        if (entry.id < 0) {
            return fail(errorMessage, "region without a valid id");
        }

        const std::string terrainKey = (*t)["terrain"].value_or(std::string());
        const CampaignConfig::TerrainArchetype* archetype =
            terrainKey.empty() ? &config.terrain.front() : config.findTerrain(terrainKey);
        if (!archetype) {
            std::ostringstream oss;
            oss << "region " << entry.id << " has unknown terrain '" << terrainKey << "'";
            return fail(errorMessage, oss.str());
        }

        RegionProfile& p = entry.profile;
        p.name = (*t)["name"].value_or("Region " + std::to_string(entry.id));
        p.terrain = archetype->key;
        p.baseEnterCost = std::max(1, tableInt(*t, "enterCost", archetype->enterCost));
        p.impassable = (*t)["impassable"].value_or(archetype->impassable);
        p.yields = archetype->yields;
        for (Resource::Type type : Resource::kAllTypes) {
            const toml::node_view<const toml::node> v = (*t)[Resource::name(type)];
            if (const auto d = v.value<double>()) {
                p.yields.setAmount(type, *d);
            } else if (const auto i = v.value<std::int64_t>()) {
                p.yields.setAmount(type, static_cast<double>(*i));
            }
        }
        p.population = std::max<std::int64_t>(0, (*t)["population"].value_or(std::int64_t{0}));
        if (!adminTierFromOrdinal(tableInt(*t, "tier", 1), p.tier)) {
            std::ostringstream oss;
            oss << "region " << entry.id << " has a tier outside 1.." << kAdminTierCount;
            return fail(errorMessage, oss.str());
        }
        p.defenders = std::max(0, tableInt(*t, "defenders", 0));
        p.stronghold = (*t)["stronghold"].value_or(false);
        entry.owner = tableInt(*t, "owner", kNeutralPlayer);

        if (const toml::array* nbs = (*t)["neighbors"].as_array()) {
            for (const auto& nb : *nbs) {
                const auto v = nb.value<std::int64_t>();
                if (!v) {
                    std::ostringstream oss;
                    oss << "region " << entry.id << " has a non-integer neighbor";
                    return fail(errorMessage, oss.str());
                }
                entry.neighbors.push_back(static_cast<int>(*v));
            }
        }
        out.push_back(std::move(entry));
    }

    std::sort(out.begin(), out.end(), [](const RegionEntry& a, const RegionEntry& b) { return a.id < b.id; });
    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].id != static_cast<int>(i)) {
            std::ostringstream oss;
            oss << "region ids must be unique and dense from 0; expected " << i << " but found " << out[i].id;
            return fail(errorMessage, oss.str());
        }
    }
    const int n = static_cast<int>(out.size());
    for (const RegionEntry& entry : out) {
        for (int nb : entry.neighbors) {
            if (nb < 0 || nb >= n || nb == entry.id) {
                std::ostringstream oss;
                oss << "region " << entry.id << " lists invalid neighbor " << nb;
                return fail(errorMessage, oss.str());
            }
        }
    }
    return true;
}

bool readArmies(const toml::table& root, int regionCount, std::vector<ArmyEntry>& out, std::string* errorMessage) {
    const toml::array* armies = root["armies"].as_array();
    if (!armies) {
        return true;
    }
    for (const auto& node : *armies) {
        const toml::table* t = node.as_table();
        if (!t) {
            return fail(errorMessage, "[[armies]] entries must be tables");
        }
        ArmyEntry entry;
        entry.id = tableInt(*t, "id", -1);
        entry.name = (*t)["name"].value_or("Army " + std::to_string(entry.id));
        entry.owner = tableInt(*t, "owner", kNeutralPlayer);
        entry.region = tableInt(*t, "region", kNoRegion);
        entry.movementPoints = tableInt(*t, "movementPoints", 0);
        entry.strength = tableInt(*t, "strength", 100);

        std::ostringstream oss;
        if (entry.id < 0) {
            oss << "army without a valid id";
        } else if (entry.owner == kNeutralPlayer) {
            oss << "army " << entry.id << " has no owner";
        } else if (entry.region < 0 || entry.region >= regionCount) {
            oss << "army " << entry.id << " starts in unknown region " << entry.region;
        } else if (entry.movementPoints < 0 || entry.strength <= 0) {
            oss << "army " << entry.id << " needs movementPoints >= 0 and strength > 0";
        } else if (std::any_of(out.begin(), out.end(), [&](const ArmyEntry& a) { return a.id == entry.id; })) {
            oss << "duplicate army id " << entry.id;
        }
        if (!oss.str().empty()) {
            return fail(errorMessage, oss.str());
        }
        out.push_back(std::move(entry));
    }
    return true;
}

bool applyScenario(const toml::table& root,
                   WorldMap& map,
                   ArmyRoster& roster,
                   ScenarioInfo* info,
                   std::string* errorMessage) {
    if (map.regionCount() != 0 || !roster.getArmies().empty()) {
        return fail(errorMessage, "scenario must be loaded into an empty map and roster");
    }

    std::vector<RegionEntry> regions;
    if (!readRegions(root, map.getConfig(), regions, errorMessage)) {
        return false;
    }
    std::vector<ArmyEntry> armies;
    if (!readArmies(root, static_cast<int>(regions.size()), armies, errorMessage)) {
        return false;
    }

    for (const RegionEntry& entry : regions) {
        map.addRegion(entry.profile, entry.owner);
    }
    // Neighbor lists may be one-sided in the file; connect() makes every edge symmetric.
    for (const RegionEntry& entry : regions) {
        for (int nb : entry.neighbors) {
            map.connect(entry.id, nb);
        }
    }
    for (const ArmyEntry& entry : armies) {
        roster.addArmy(entry.id, entry.name, entry.owner, entry.region, entry.movementPoints, entry.strength);
    }

    if (info) {
        info->name = root["scenario"]["name"].value_or(std::string());
        info->description = root["scenario"]["description"].value_or(std::string());
        info->regionCount = static_cast<int>(regions.size());
        info->armyCount = static_cast<int>(armies.size());
    }
    return true;
}

} // namespace

bool loadScenario(const std::string& path,
                  WorldMap& map,
                  ArmyRoster& roster,
                  ScenarioInfo* info,
                  std::string* errorMessage) {
    try {
        const toml::table root = toml::parse_file(path);
        if (!applyScenario(root, map, roster, info, errorMessage)) {
            if (errorMessage) {
                *errorMessage = "Scenario '" + path + "': " + *errorMessage;
            }
            return false;
        }
        return true;
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse scenario '" << path << "': " << err.description();
        return fail(errorMessage, oss.str());
    }
}

bool loadScenarioFromString(const std::string& text,
                            WorldMap& map,
                            ArmyRoster& roster,
                            ScenarioInfo* info,
                            std::string* errorMessage) {
    try {
        const toml::table root = toml::parse(text);
        return applyScenario(root, map, roster, info, errorMessage);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse scenario: " << err.description();
        return fail(errorMessage, oss.str());
    }
}
