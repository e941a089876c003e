#pragma once

/// @file types.h
/// @brief Domain enumerations shared by every SupportPulse module

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace supportpulse {

/// Customer issue category supplied with each request
enum class IssueType {
    kGeneral = 0,
    kAccountAccess,
    kBilling,
    kShipping,
    kTechnicalSupport,
    kComplaint,
    kCompliment
};

inline constexpr std::array<IssueType, 7> kAllIssueTypes = {
    IssueType::kGeneral,
    IssueType::kAccountAccess,
    IssueType::kBilling,
    IssueType::kShipping,
    IssueType::kTechnicalSupport,
    IssueType::kComplaint,
    IssueType::kCompliment,
};

/// Three-step scale used for satisfaction, priority and report severity
enum class Level {
    kLow = 0,
    kMedium,
    kHigh
};

inline constexpr std::array<Level, 3> kAllLevels = {Level::kLow, Level::kMedium, Level::kHigh};

/// Wire name ("account_access", ...)
std::string_view IssueTypeName(IssueType type);

/// Exact, case-sensitive parse of a wire name; nullopt for anything else
std::optional<IssueType> ParseIssueType(std::string_view name);

/// Wire name ("low", "medium", "high")
std::string_view LevelName(Level level);

std::optional<Level> ParseLevel(std::string_view name);

/// ISO-8601 UTC timestamp with millisecond precision
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

}  // namespace supportpulse
