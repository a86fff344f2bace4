#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "resource.h"

struct CampaignConfig {
    struct Planner {
        int defaultHorizon = 10;
        int reachableIterationCap = 20000;
        int shortestPathIterationCap = 200000;
        int maxPathLength = 4096;
        // MP discount when entering a region the mover's player already owns (floor 1).
        int ownedDiscount = 1;
    } planner{};

    struct Scoring {
        double populationWeight = 0.30;
        double resourceWeight = 0.40;
        double levelWeight = 0.20;
        double ownershipWeight = 0.10;
        double neutralOwnershipScore = 0.8;
        double selfOwnershipScore = 0.1;
        double rivalOwnershipScore = 1.0;
        double primaryResourceShare = 0.80; // remainder goes to the treasury bonus
        double treasuryDivisor = 3.0;
        double jitterAmplitude = 2.0;       // on the 0..100 base-score scale
    } scoring{};

    struct Resources {
        double foodImportance = 0.50;
        double woodImportance = 0.25;
        double ironImportance = 0.25;
    } resources{};

    struct PopulationBand {
        int tier = 1;
        long long minValue = 0;
        long long maxValue = 0;
    };

    struct TerrainArchetype {
        std::string key;
        int enterCost = 1;
        bool impassable = false;
        ResourceYield yields;
    };

    struct Orchestrator {
        // 0 plans with the army's current MP; a larger value also considers targets
        // that take more than one turn to reach.
        int planningHorizon = 0;
        bool debug = false;
    } orchestrator{};

    struct Reinforcement {
        double strengthThreshold = 0.50;
    } reinforcement{};

    std::vector<PopulationBand> populationBands = defaultPopulationBands();
    std::vector<TerrainArchetype> terrain = defaultTerrain();

    const TerrainArchetype* findTerrain(const std::string& key) const;
    // Largest yield of `type` over every terrain archetype.
    double maxYield(Resource::Type type) const;
    double importanceOf(Resource::Type type) const;
    const PopulationBand& lowestBand() const;

    // Renormalizes weights, orders bands and clamps caps. Called after loading.
    void sanitize();

    static std::vector<PopulationBand> defaultPopulationBands();
    static std::vector<TerrainArchetype> defaultTerrain();
};

struct CampaignContext {
    std::uint64_t sessionSeed = 0;
    CampaignConfig config;
    std::string configPath;
    std::string configHash;

    explicit CampaignContext(std::uint64_t seed, const std::string& runtimeConfigPath = "data/campaign_config.toml");

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    std::uint64_t seedForArmy(int armyId) const;

    static std::uint64_t mix64(std::uint64_t x);
    static double u01FromU64(std::uint64_t x);
};
