#include "resource.h"

#include <algorithm>

const char* Resource::name(Type type) {
    switch (type) {
        case Type::FOOD: return "food";
        case Type::WOOD: return "wood";
        case Type::IRON: return "iron";
        case Type::GOLD: return "gold";
    }
    return "";
}

ResourceYield::ResourceYield() {
    m_amounts.fill(0.0);
}

ResourceYield::ResourceYield(double food, double wood, double iron, double gold)
    : m_amounts{{food, wood, iron, gold}} {}

double ResourceYield::getAmount(Resource::Type type) const {
    return m_amounts[static_cast<size_t>(type)];
}

void ResourceYield::setAmount(Resource::Type type, double amount) {
    m_amounts[static_cast<size_t>(type)] = std::max(0.0, amount);
}
