#include "campaign_services.h"

const char* adminTierName(AdminTier tier) {
    switch (tier) {
        case AdminTier::Hamlet: return "hamlet";
        case AdminTier::Village: return "village";
        case AdminTier::Town: return "town";
        case AdminTier::City: return "city";
        case AdminTier::Capital: return "capital";
    }
    return "";
}

bool adminTierFromOrdinal(int ordinal, AdminTier& out) {
    if (ordinal < 1 || ordinal > kAdminTierCount) {
        return false;
    }
    out = static_cast<AdminTier>(ordinal);
    return true;
}

const char* battleVerdictName(BattleVerdict verdict) {
    switch (verdict) {
        case BattleVerdict::Victory: return "victory";
        case BattleVerdict::Defeat: return "defeat";
        case BattleVerdict::Draw: return "draw";
    }
    return "";
}
