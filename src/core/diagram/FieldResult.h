/**
 * @file FieldResult.h
 * @brief Outcome type for fail-soft property setters
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_FIELDRESULT_H
#define CIRCUITSKETCH_CORE_DIAGRAM_FIELDRESULT_H

#include <string>
#include <utility>
#include <vector>

namespace circuitsketch::core::diagram {

/**
 * @brief Result of a validated setter
 *
 * A rejected value never touches the field; the reason is handed back so the
 * caller can decide whether to log it.
 */
struct FieldResult {
    bool accepted = true;
    std::string field;
    std::string reason;

    static FieldResult ok(std::string fieldName) {
        return {true, std::move(fieldName), {}};
    }

    static FieldResult rejected(std::string fieldName, std::string why) {
        return {false, std::move(fieldName), std::move(why)};
    }

    explicit operator bool() const { return accepted; }
};

/**
 * @brief Aggregated outcome of an edit(partial) call
 */
struct EditResult {
    std::vector<std::string> applied;
    std::vector<FieldResult> rejected;

    bool ok() const { return rejected.empty(); }

    void add(const FieldResult& result) {
        if (result.accepted) {
            applied.push_back(result.field);
        } else {
            rejected.push_back(result);
        }
    }
};

} // namespace circuitsketch::core::diagram

#endif // CIRCUITSKETCH_CORE_DIAGRAM_FIELDRESULT_H
