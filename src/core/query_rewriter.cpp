#include "core/query_rewriter.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <format>

namespace rlsengine {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Strip trailing whitespace and one trailing semicolon
std::string strip_terminator(const std::string& sql) {
    std::string s = utils::trim(sql);
    while (!s.empty() && s.back() == ';') {
        s.pop_back();
        s = utils::trim(s);
    }
    return s;
}

} // anonymous namespace

std::optional<std::string> QueryRewriter::rewrite(
    const std::string& sql, const FilterDecision& decision) {

    if (decision.access_denied) return std::nullopt;
    if (!decision.has_filters || !decision.where_clause) return sql;
    return inject_where(sql, *decision.where_clause);
}

std::optional<std::string> QueryRewriter::wrap(
    const std::string& sql, const FilterDecision& decision) {

    if (decision.access_denied) return std::nullopt;
    if (!decision.has_filters || !decision.where_clause) return sql;
    return std::format("SELECT * FROM ({}) AS {} WHERE {}",
                       strip_terminator(sql), kWrapAlias, *decision.where_clause);
}

size_t QueryRewriter::find_top_level(const std::string& sql, std::string_view keyword, size_t from) {
    int depth = 0;
    char quote = 0;

    for (size_t i = from; i < sql.size(); ++i) {
        const char c = sql[i];
        if (quote) {
            if (c == quote) {
                // Doubled quote is an escaped quote
                if (i + 1 < sql.size() && sql[i + 1] == quote) {
                    ++i;
                } else {
                    quote = 0;
                }
            }
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            continue;
        }
        if (c == '(') { ++depth; continue; }
        if (c == ')') { if (depth > 0) --depth; continue; }
        if (depth > 0) continue;

        if (i > 0 && is_word_char(sql[i - 1])) continue;

        // Match keyword, treating any whitespace run as one space
        size_t j = i;
        size_t k = 0;
        while (k < keyword.size() && j < sql.size()) {
            if (keyword[k] == ' ') {
                if (!std::isspace(static_cast<unsigned char>(sql[j]))) break;
                while (j < sql.size() && std::isspace(static_cast<unsigned char>(sql[j]))) ++j;
                ++k;
                continue;
            }
            if (std::tolower(static_cast<unsigned char>(sql[j])) != keyword[k]) break;
            ++j;
            ++k;
        }
        if (k == keyword.size() && (j >= sql.size() || !is_word_char(sql[j]))) {
            return i;
        }
    }
    return std::string::npos;
}

std::string QueryRewriter::inject_where(const std::string& sql, const std::string& condition) {
    static constexpr std::array<std::string_view, 7> kTerminators = {
        "order by", "group by", "having", "limit", "union", "intersect", "except"
    };

    const size_t where_pos = find_top_level(sql, "where");
    const size_t search_from = where_pos == std::string::npos ? 0 : where_pos + 5;

    size_t insert_pos = sql.size();
    for (const auto term : kTerminators) {
        const size_t pos = find_top_level(sql, term, search_from);
        if (pos < insert_pos) insert_pos = pos;
    }

    const size_t semi = sql.find_last_not_of(" \t\r\n");
    if (semi != std::string::npos && sql[semi] == ';' && semi < insert_pos) {
        insert_pos = semi;
    }

    std::string head = sql.substr(0, insert_pos);
    while (!head.empty() && std::isspace(static_cast<unsigned char>(head.back()))) {
        head.pop_back();
    }
    const std::string tail = insert_pos < sql.size() ? sql.substr(insert_pos) : std::string{};
    const std::string separator = tail.empty() || tail.front() == ';' ? "" : " ";

    if (where_pos == std::string::npos) {
        return std::format("{} WHERE ({}){}{}", head, condition, separator, tail);
    }

    // Existing predicate keeps its own precedence inside parentheses
    const std::string existing = utils::trim(head.substr(where_pos + 5));
    return std::format("{} WHERE ({}) AND ({}){}{}",
                       utils::trim(head.substr(0, where_pos)), condition, existing, separator, tail);
}

} // namespace rlsengine
