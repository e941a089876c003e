#include "types.h"

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace supportpulse {

std::string_view IssueTypeName(IssueType type) {
    switch (type) {
        case IssueType::kGeneral: return "general";
        case IssueType::kAccountAccess: return "account_access";
        case IssueType::kBilling: return "billing";
        case IssueType::kShipping: return "shipping";
        case IssueType::kTechnicalSupport: return "technical_support";
        case IssueType::kComplaint: return "complaint";
        case IssueType::kCompliment: return "compliment";
    }
    return "general";
}

std::optional<IssueType> ParseIssueType(std::string_view name) {
    for (IssueType type : kAllIssueTypes) {
        if (IssueTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string_view LevelName(Level level) {
    switch (level) {
        case Level::kLow: return "low";
        case Level::kMedium: return "medium";
        case Level::kHigh: return "high";
    }
    return "medium";
}

std::optional<Level> ParseLevel(std::string_view name) {
    for (Level level : kAllLevels) {
        if (LevelName(level) == name) {
            return level;
        }
    }
    return std::nullopt;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", absl::FromChrono(time),
                            absl::UTCTimeZone());
}

}  // namespace supportpulse
