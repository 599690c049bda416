#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rlsengine {

/**
 * @brief Applies a FilterDecision to a SQL statement
 *
 * rewrite(): injects the where clause as a conjunct of the top-level WHERE,
 * or adds a WHERE before ORDER BY / GROUP BY / HAVING / LIMIT / set operators
 * / trailing semicolon. Keywords inside string literals, quoted identifiers
 * and parentheses are ignored.
 *
 * wrap(): SELECT * FROM (<sql>) AS __rls_filtered WHERE <clause>
 *
 * Both return nullopt for a denied decision (the caller must reject the
 * query) and the statement unchanged when there is no filter.
 */
class QueryRewriter {
public:
    [[nodiscard]] static std::optional<std::string> rewrite(
        const std::string& sql, const FilterDecision& decision);

    [[nodiscard]] static std::optional<std::string> wrap(
        const std::string& sql, const FilterDecision& decision);

    static constexpr std::string_view kWrapAlias = "__rls_filtered";

private:
    static std::string inject_where(const std::string& sql, const std::string& condition);

    /// Offset of a top-level keyword (case-insensitive, word bounded) at or after `from`
    static size_t find_top_level(const std::string& sql, std::string_view keyword, size_t from = 0);
};

} // namespace rlsengine
