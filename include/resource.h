#pragma once

#include <array>
#include <string>

class Resource {
public:
    enum class Type {
        FOOD = 0,
        WOOD = 1,
        IRON = 2,
        GOLD = 3
    };

    static constexpr int kTypeCount = 4;
    static constexpr std::array<Type, kTypeCount> kAllTypes = {
        Type::FOOD,
        Type::WOOD,
        Type::IRON,
        Type::GOLD
    };

    // Types blended into the primary part of a region's resource score.
    // GOLD is the treasury and is scored separately.
    static constexpr std::array<Type, 3> kPrimaryTypes = {
        Type::FOOD,
        Type::WOOD,
        Type::IRON
    };

    static const char* name(Type type);
};

// Per-region yield of every resource type.
class ResourceYield {
public:
    ResourceYield();
    ResourceYield(double food, double wood, double iron, double gold);

    double getAmount(Resource::Type type) const;
    void setAmount(Resource::Type type, double amount);

private:
    std::array<double, Resource::kTypeCount> m_amounts;
};
