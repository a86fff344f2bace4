#pragma once

#include <string>

#include "army.h"
#include "world_map.h"

struct ScenarioInfo {
    std::string name;
    std::string description;
    int regionCount = 0;
    int armyCount = 0;
};

// Reads [[regions]] and [[armies]] from a TOML scenario into an empty map and roster.
// Everything is validated before the first region is added, so on failure `map` and
// `roster` are left untouched.
bool loadScenario(const std::string& path,
                  WorldMap& map,
                  ArmyRoster& roster,
                  ScenarioInfo* info = nullptr,
                  std::string* errorMessage = nullptr);

bool loadScenarioFromString(const std::string& text,
                            WorldMap& map,
                            ArmyRoster& roster,
                            ScenarioInfo* info = nullptr,
                            std::string* errorMessage = nullptr);
