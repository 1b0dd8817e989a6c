//
// Created by Giuseppe Francione on 08/10/26.
//

#include "../../include/query_engine.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_store.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>

namespace datacat {

namespace {

constexpr auto kSelect =
    "SELECT d.id, d.time, d.end_time, d.mp_id, d.source, d.radar, d.domain, d.method, d.hydrometeor "
    "FROM dataset d WHERE ";

// records whose roles were all detached stay stored but are not returned
constexpr auto kVisible =
    " AND EXISTS (SELECT 1 FROM dataset_file df WHERE df.dataset_id = d.id)";

} // namespace

QueryEngine::Predicate QueryEngine::build_predicate(const QueryFilter& filter) const {
    Predicate pred;
    const FileStore files(store_);
    for (const Field field : all_fields()) {
        const auto value = filter.get(field);
        if (!value) continue;
        if (!product_.supports(field)) {
            Logger::log(LogLevel::Debug,
                        "Product " + product_.name + " has no " + std::string(field_name(field)) +
                        ", filter ignored", "query");
            continue;
        }
        const auto label = files.reference_label(field_category(field), *value);
        if (!label) {
            throw std::invalid_argument("unknown " + std::string(field_name(field)) + " '" + *value + "'");
        }
        pred.sql += " AND d." + std::string(field_name(field)) + " = ?";
        if (field == Field::MpId) {
            pred.args.emplace_back(*filter.mp_id);
        } else {
            pred.args.emplace_back(*label);
        }
    }
    return pred;
}

void QueryEngine::bind_predicate(Statement& stmt, const Predicate& predicate, int first) {
    for (const auto& arg : predicate.args) {
        if (const auto* i = std::get_if<std::int64_t>(&arg)) {
            stmt.bind(first++, *i);
        } else {
            stmt.bind(first++, std::string_view(std::get<std::string>(arg)));
        }
    }
}

std::vector<DatasetRecord> QueryEngine::fetch(Statement& stmt) const {
    std::vector<DatasetRecord> records;
    while (stmt.step()) {
        DatasetRecord rec;
        rec.id = stmt.column_int64(0);
        rec.key.time = from_unix(stmt.column_int64(1));
        rec.key.end_time = from_unix(stmt.column_int64(2));
        rec.key.mp_id = stmt.column_opt_int64(3);
        rec.key.source = stmt.column_opt_text(4);
        rec.key.radar = stmt.column_opt_text(5);
        rec.key.domain = stmt.column_opt_text(6);
        rec.key.method = stmt.column_opt_text(7);
        rec.key.hydrometeor = stmt.column_opt_text(8);
        records.push_back(std::move(rec));
    }
    for (auto& rec : records) {
        load_details(rec);
    }
    return records;
}

void QueryEngine::load_details(DatasetRecord& record) const {
    auto roles = store_.prepare(
        "SELECT df.role, f.id, f.path, k.name, f.last_checked FROM dataset_file df "
        "JOIN datafile f ON f.id = df.file_id JOIN file_kind k ON k.id = f.kind_id "
        "WHERE df.dataset_id = ? ORDER BY df.role;");
    roles.bind(1, record.id);
    while (roles.step()) {
        record.roles.emplace(roles.column_text(0),
                             FileRecord{roles.column_int64(1), roles.column_text(2), roles.column_text(3),
                                        from_unix_nanos(roles.column_int64(4))});
    }

    auto attrs = store_.prepare("SELECT name, value FROM dataset_attribute WHERE dataset_id = ?;");
    attrs.bind(1, record.id);
    while (attrs.step()) {
        record.attributes.emplace(attrs.column_text(0), attrs.column_text(1));
    }
}

std::vector<DatasetRecord> QueryEngine::range(const TimePoint start, const TimePoint end,
                                              const QueryFilter& filter) const {
    if (start > end) {
        throw std::invalid_argument("range start " + format_time(start) + " is after end " + format_time(end));
    }
    const auto pred = build_predicate(filter);
    auto q = store_.prepare(std::string(kSelect) + "d.time >= ? AND d.time <= ?" + pred.sql + kVisible +
                            " ORDER BY d.time ASC, d.id ASC;");
    q.bind(1, to_unix(start)).bind(2, to_unix(end));
    bind_predicate(q, pred, 3);
    return fetch(q);
}

DatasetRecord QueryEngine::closest(const TimePoint t, const QueryFilter& filter) const {
    const auto pred = build_predicate(filter);

    auto lesser_q = store_.prepare(std::string(kSelect) + "d.time <= ?" + pred.sql + kVisible +
                                   " ORDER BY d.time DESC, d.id ASC LIMIT 1;");
    lesser_q.bind(1, to_unix(t));
    bind_predicate(lesser_q, pred, 2);
    auto lesser = fetch(lesser_q);

    auto greater_q = store_.prepare(std::string(kSelect) + "d.time > ?" + pred.sql + kVisible +
                                    " ORDER BY d.time ASC, d.id ASC LIMIT 1;");
    greater_q.bind(1, to_unix(t));
    bind_predicate(greater_q, pred, 2);
    auto greater = fetch(greater_q);

    if (lesser.empty() && greater.empty()) {
        throw NotFoundError("no dataset of product " + product_.name + " matches the filter");
    }
    if (greater.empty()) return std::move(lesser.front());
    if (lesser.empty()) return std::move(greater.front());

    // equal distance resolves to the earlier record
    const auto to_greater = greater.front().key.time - t;
    const auto to_lesser = t - lesser.front().key.time;
    return to_greater < to_lesser ? std::move(greater.front()) : std::move(lesser.front());
}

std::vector<DatasetRecord> QueryEngine::latest(const std::size_t n, const QueryFilter& filter) const {
    if (n == 0) return {};
    const auto pred = build_predicate(filter);
    auto q = store_.prepare(std::string(kSelect) + "1" + pred.sql + kVisible +
                            " ORDER BY d.time DESC, d.id DESC LIMIT ?;");
    bind_predicate(q, pred, 1);
    q.bind(static_cast<int>(pred.args.size()) + 1, static_cast<std::int64_t>(n));
    return fetch(q);
}

std::vector<DatasetRecord> QueryEngine::all() const {
    auto q = store_.prepare(std::string(kSelect) + "1" + kVisible + " ORDER BY d.time ASC, d.id ASC;");
    return fetch(q);
}

std::size_t QueryEngine::count() const {
    auto q = store_.prepare("SELECT COUNT(*) FROM dataset;");
    q.step();
    return static_cast<std::size_t>(q.column_int64(0));
}

} // namespace datacat
