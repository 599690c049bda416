#pragma once

#include "policy/policy_types.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace rlsengine {

/**
 * @brief Immutable view of the store at one generation
 *
 * Published through std::atomic<std::shared_ptr<const PolicySnapshot>>;
 * one evaluation reads exactly one snapshot, so policy and role identity
 * cannot change underneath it.
 */
struct PolicySnapshot {
    std::vector<RlsPolicy> policies;
    std::vector<SecurityRole> roles;
    RlsConfiguration config;
    uint64_t generation = 0;
    std::chrono::steady_clock::time_point loaded_at;
};

} // namespace rlsengine
