#pragma once

#include <string>

namespace budget::domain {

enum class EntityKind {
    BUDGET,
    ACCOUNT,
    CATEGORY_GROUP,
    CATEGORY,
    PAYEE,
    TRANSACTION,
    SCHEDULED_TRANSACTION,
    MONTH_BUDGET
};

inline std::string toString(EntityKind kind) {
    switch (kind) {
        case EntityKind::BUDGET: return "budget";
        case EntityKind::ACCOUNT: return "account";
        case EntityKind::CATEGORY_GROUP: return "category_group";
        case EntityKind::CATEGORY: return "category";
        case EntityKind::PAYEE: return "payee";
        case EntityKind::TRANSACTION: return "transaction";
        case EntityKind::SCHEDULED_TRANSACTION: return "scheduled_transaction";
        case EntityKind::MONTH_BUDGET: return "month";
        default: return "unknown";
    }
}

} // namespace budget::domain
