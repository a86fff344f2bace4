#include "campaign_context.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <utility>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    }
}

double tableDouble(const toml::table& t, std::string_view key, double fallback) {
    if (const auto v = t[key].value<double>()) {
        return *v;
    }
    if (const auto vi = t[key].value<std::int64_t>()) {
        return static_cast<double>(*vi);
    }
    return fallback;
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Scales `values` so they sum to 1. Leaves them alone if the sum is not positive.
template <size_t N>
bool normalizeWeights(std::array<double*, N> values) {
    double sum = 0.0;
    for (double* v : values) {
        if (*v < 0.0) *v = 0.0;
        sum += *v;
    }
    if (sum <= 0.0) {
        return false;
    }
    if (std::abs(sum - 1.0) > 1.0e-9) {
        for (double* v : values) {
            *v /= sum;
        }
    }
    return true;
}

} // namespace

const CampaignConfig::TerrainArchetype* CampaignConfig::findTerrain(const std::string& key) const {
    const std::string lower = toLowerAscii(key);
    for (const TerrainArchetype& t : terrain) {
        if (t.key == lower) {
            return &t;
        }
    }
    return nullptr;
}

double CampaignConfig::maxYield(Resource::Type type) const {
    double best = 0.0;
    for (const TerrainArchetype& t : terrain) {
        best = std::max(best, t.yields.getAmount(type));
    }
    return best;
}

double CampaignConfig::importanceOf(Resource::Type type) const {
    switch (type) {
        case Resource::Type::FOOD: return resources.foodImportance;
        case Resource::Type::WOOD: return resources.woodImportance;
        case Resource::Type::IRON: return resources.ironImportance;
        case Resource::Type::GOLD: return 0.0;
    }
    return 0.0;
}

const CampaignConfig::PopulationBand& CampaignConfig::lowestBand() const {
    // sanitize() keeps at least one band, sorted by tier.
    return populationBands.front();
}

void CampaignConfig::sanitize() {
    if (!normalizeWeights<4>({&scoring.populationWeight, &scoring.resourceWeight,
                              &scoring.levelWeight, &scoring.ownershipWeight})) {
        const Scoring defaults{};
        scoring.populationWeight = defaults.populationWeight;
        scoring.resourceWeight = defaults.resourceWeight;
        scoring.levelWeight = defaults.levelWeight;
        scoring.ownershipWeight = defaults.ownershipWeight;
    }
    if (!normalizeWeights<3>({&resources.foodImportance, &resources.woodImportance,
                              &resources.ironImportance})) {
        resources = Resources{};
    }

    scoring.neutralOwnershipScore = std::clamp(scoring.neutralOwnershipScore, 0.0, 1.0);
    scoring.selfOwnershipScore = std::clamp(scoring.selfOwnershipScore, 0.0, 1.0);
    scoring.rivalOwnershipScore = std::clamp(scoring.rivalOwnershipScore, 0.0, 1.0);
    scoring.primaryResourceShare = std::clamp(scoring.primaryResourceShare, 0.0, 1.0);
    if (scoring.treasuryDivisor <= 0.0) {
        scoring.treasuryDivisor = 3.0;
    }
    scoring.jitterAmplitude = std::max(0.0, scoring.jitterAmplitude);

    planner.defaultHorizon = std::max(0, planner.defaultHorizon);
    planner.reachableIterationCap = std::max(1, planner.reachableIterationCap);
    planner.shortestPathIterationCap = std::max(planner.reachableIterationCap, planner.shortestPathIterationCap);
    planner.maxPathLength = std::max(2, planner.maxPathLength);
    planner.ownedDiscount = std::max(0, planner.ownedDiscount);
    orchestrator.planningHorizon = std::max(0, orchestrator.planningHorizon);
    reinforcement.strengthThreshold = std::clamp(reinforcement.strengthThreshold, 0.0, 1.0);

    if (populationBands.empty()) {
        populationBands = defaultPopulationBands();
    }
    for (PopulationBand& band : populationBands) {
        if (band.maxValue < band.minValue) {
            std::swap(band.maxValue, band.minValue);
        }
    }
    std::sort(populationBands.begin(), populationBands.end(), [](const PopulationBand& a, const PopulationBand& b) {
        return a.tier < b.tier;
    });

    if (terrain.empty()) {
        terrain = defaultTerrain();
    }
    for (TerrainArchetype& t : terrain) {
        t.key = toLowerAscii(t.key);
        t.enterCost = std::max(1, t.enterCost);
    }
}

std::vector<CampaignConfig::PopulationBand> CampaignConfig::defaultPopulationBands() {
    return {
        {1, 50, 500},
        {2, 500, 2000},
        {3, 2000, 8000},
        {4, 8000, 30000},
        {5, 30000, 120000},
    };
}

std::vector<CampaignConfig::TerrainArchetype> CampaignConfig::defaultTerrain() {
    return {
        {"plains", 2, false, ResourceYield(8.0, 2.0, 0.0, 2.0)},
        {"forest", 3, false, ResourceYield(3.0, 10.0, 1.0, 1.0)},
        {"hills", 4, false, ResourceYield(3.0, 3.0, 6.0, 3.0)},
        {"mountains", 6, false, ResourceYield(1.0, 1.0, 10.0, 6.0)},
        {"marsh", 5, false, ResourceYield(4.0, 4.0, 0.0, 0.0)},
        {"water", 1, true, ResourceYield()},
    };
}

CampaignContext::CampaignContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : sessionSeed(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    config.sanitize();
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
}

bool CampaignContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = CampaignConfig{};
    config.sanitize();
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "planner", "defaultHorizon", config.planner.defaultHorizon);
        readTomlValue(root, "planner", "reachableIterationCap", config.planner.reachableIterationCap);
        readTomlValue(root, "planner", "shortestPathIterationCap", config.planner.shortestPathIterationCap);
        readTomlValue(root, "planner", "maxPathLength", config.planner.maxPathLength);
        readTomlValue(root, "planner", "ownedDiscount", config.planner.ownedDiscount);

        readTomlValue(root, "scoring", "populationWeight", config.scoring.populationWeight);
        readTomlValue(root, "scoring", "resourceWeight", config.scoring.resourceWeight);
        readTomlValue(root, "scoring", "levelWeight", config.scoring.levelWeight);
        readTomlValue(root, "scoring", "ownershipWeight", config.scoring.ownershipWeight);
        readTomlValue(root, "scoring", "neutralOwnershipScore", config.scoring.neutralOwnershipScore);
        readTomlValue(root, "scoring", "selfOwnershipScore", config.scoring.selfOwnershipScore);
        readTomlValue(root, "scoring", "rivalOwnershipScore", config.scoring.rivalOwnershipScore);
        readTomlValue(root, "scoring", "primaryResourceShare", config.scoring.primaryResourceShare);
        readTomlValue(root, "scoring", "treasuryDivisor", config.scoring.treasuryDivisor);
        readTomlValue(root, "scoring", "jitterAmplitude", config.scoring.jitterAmplitude);

        readTomlValue(root, "resources", "foodImportance", config.resources.foodImportance);
        readTomlValue(root, "resources", "woodImportance", config.resources.woodImportance);
        readTomlValue(root, "resources", "ironImportance", config.resources.ironImportance);

        readTomlValue(root, "orchestrator", "planningHorizon", config.orchestrator.planningHorizon);
        readTomlValue(root, "orchestrator", "debug", config.orchestrator.debug);
        readTomlValue(root, "reinforcement", "strengthThreshold", config.reinforcement.strengthThreshold);

        if (const toml::array* bands = root["populationBands"].as_array()) {
            config.populationBands.clear();
            config.populationBands.reserve(bands->size());
            for (const auto& node : *bands) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                CampaignConfig::PopulationBand band{};
                if (const auto v = (*t)["tier"].value<std::int64_t>()) band.tier = static_cast<int>(*v);
                if (const auto v = (*t)["min"].value<std::int64_t>()) band.minValue = *v;
                if (const auto v = (*t)["max"].value<std::int64_t>()) band.maxValue = *v;
                if (band.tier < 1 || band.tier > 5) continue;
                config.populationBands.push_back(band);
            }
        }

        if (const toml::array* terrain = root["terrain"].as_array()) {
            config.terrain.clear();
            config.terrain.reserve(terrain->size());
            for (const auto& node : *terrain) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                CampaignConfig::TerrainArchetype archetype{};
                if (const auto v = (*t)["key"].value<std::string>()) archetype.key = *v;
                if (const auto v = (*t)["enterCost"].value<std::int64_t>()) archetype.enterCost = static_cast<int>(*v);
                if (const auto v = (*t)["impassable"].value<bool>()) archetype.impassable = *v;
                for (Resource::Type type : Resource::kAllTypes) {
                    archetype.yields.setAmount(type, tableDouble(*t, Resource::name(type), 0.0));
                }
                if (archetype.key.empty()) continue;
                config.terrain.push_back(std::move(archetype));
            }
        }

        config.sanitize();
        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    config = CampaignConfig{};
    config.sanitize();
    return false;
}

std::string CampaignContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::uint64_t CampaignContext::seedForArmy(int armyId) const {
    const std::uint64_t idx = static_cast<std::uint64_t>(static_cast<std::int64_t>(armyId));
    return mix64(sessionSeed ^ (idx * 0x9E3779B97F4A7C15ull) ^ 0xA5A5A5A5A5A5A5A5ull);
}

std::uint64_t CampaignContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

double CampaignContext::u01FromU64(std::uint64_t x) {
    // 53 random bits to [0,1).
    const std::uint64_t mantissa = (x >> 11);
    return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0);
}
