#pragma once

#include <string>
#include <string_view>

namespace rlsengine::policy {

// Denial reasons surfaced in FilterDecision::denial_reason
inline constexpr std::string_view kNoMatchingPolicy = "no_matching_policy";
inline constexpr std::string_view kEngineUnavailable = "engine_unavailable";

// Constant predicates in rendered SQL
inline constexpr std::string_view kSqlTrue = "1=1";
inline constexpr std::string_view kSqlFalse = "1=0";

// Attribute name selecting a CustomAttribute in the wire format
inline constexpr std::string_view kCustomAttribute = "custom";

inline constexpr std::string_view kDefaultSchema = "public";

} // namespace rlsengine::policy
