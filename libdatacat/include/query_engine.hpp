//
// Created by Giuseppe Francione on 08/10/26.
//

/**
 * @file query_engine.hpp
 * @brief Read-only range, closest and latest lookups over the DatasetRecords.
 */

#ifndef DATACAT_QUERY_ENGINE_HPP
#define DATACAT_QUERY_ENGINE_HPP

#include "product.hpp"
#include "records.hpp"
#include "sqlite_store.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace datacat {

/**
 * @brief Answers the three query shapes over committed state.
 *
 * @details Filters are applied as SQL equality predicates before the
 * temporal operation. Only DatasetRecords with at least one populated role
 * are visible. Filters on fields the product does not support are dropped;
 * values of reference categories are validated against the store's
 * reference data and normalized to their label.
 */
class QueryEngine {
public:
    QueryEngine(SqliteStore& store, const ProductSchema& product)
        : store_(store), product_(product) {}

    /**
     * @brief Records with @p start <= time <= @p end, ascending by time.
     * @throws std::invalid_argument if start > end or a filter value is unknown.
     */
    [[nodiscard]] std::vector<DatasetRecord> range(TimePoint start, TimePoint end,
                                                   const QueryFilter& filter) const;

    /**
     * @brief Record closest to @p t. On equal distance the earlier one wins.
     * @throws NotFoundError if no record passes the filter.
     */
    [[nodiscard]] DatasetRecord closest(TimePoint t, const QueryFilter& filter) const;

    /**
     * @brief Up to @p n records, most recent first.
     */
    [[nodiscard]] std::vector<DatasetRecord> latest(std::size_t n, const QueryFilter& filter) const;

    /// Every visible record, ascending by time.
    [[nodiscard]] std::vector<DatasetRecord> all() const;

    /// Number of stored DatasetRecords, including ones without roles.
    [[nodiscard]] std::size_t count() const;

private:
    struct Predicate {
        std::string sql;                     ///< " AND ..." clause
        std::vector<std::variant<std::int64_t, std::string>> args; ///< bound in order
    };

    [[nodiscard]] Predicate build_predicate(const QueryFilter& filter) const;
    /// Bind the predicate arguments starting at @p first.
    static void bind_predicate(Statement& stmt, const Predicate& predicate, int first);
    [[nodiscard]] std::vector<DatasetRecord> fetch(Statement& stmt) const;
    void load_details(DatasetRecord& record) const;

    SqliteStore& store_;
    const ProductSchema& product_;
};

} // namespace datacat

#endif // DATACAT_QUERY_ENGINE_HPP
