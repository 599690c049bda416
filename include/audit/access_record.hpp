#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rlsengine {

/**
 * @brief One access-log entry: who asked for which table and what they got
 *
 * In audit mode `decision` is the non-enforcing result handed to the caller
 * and `would_be` the decision enforcement would have produced.
 */
struct AccessRecord {
    std::string record_id;
    uint64_t sequence_num = 0;
    std::chrono::system_clock::time_point timestamp;

    // Request
    std::string user_id;
    std::string username;
    std::vector<std::string> roles;
    TableIdentity table;

    // Outcome
    FilterDecision decision;
    std::optional<FilterDecision> would_be;
    bool audit_only = false;
    bool cache_hit = false;
    uint64_t generation = 0;
    std::chrono::microseconds evaluation_time{0};

    // Integrity (set by the writer thread)
    std::string record_hash;
    std::string previous_hash;
};

} // namespace rlsengine
