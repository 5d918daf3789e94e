#pragma once

#include <optional>
#include <string>

namespace budget::domain {

enum class ClearedStatus {
    CLEARED,
    UNCLEARED,
    RECONCILED
};

inline std::string toString(ClearedStatus status) {
    switch (status) {
        case ClearedStatus::CLEARED: return "cleared";
        case ClearedStatus::UNCLEARED: return "uncleared";
        case ClearedStatus::RECONCILED: return "reconciled";
        default: return "uncleared";
    }
}

inline std::optional<ClearedStatus> parseClearedStatus(const std::string& str) {
    if (str == "cleared") return ClearedStatus::CLEARED;
    if (str == "uncleared") return ClearedStatus::UNCLEARED;
    if (str == "reconciled") return ClearedStatus::RECONCILED;
    return std::nullopt;
}

} // namespace budget::domain
