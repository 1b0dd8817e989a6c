//
// Created by Giuseppe Francione on 08/10/26.
//

#include "../../include/dataset_linker.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace datacat {

std::vector<std::int64_t> DatasetLinker::find(const IdentityKey& key) const {
    auto q = store_.prepare("SELECT id FROM dataset WHERE identity = ? ORDER BY id;");
    q.bind(1, key.canonical());
    std::vector<std::int64_t> ids;
    while (q.step()) ids.push_back(q.column_int64(0));
    return ids;
}

std::int64_t DatasetLinker::insert_dataset(const IdentityKey& key) {
    store_.prepare(
        "INSERT INTO dataset(identity, time, end_time, mp_id, source, radar, domain, method, hydrometeor) "
        "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?);")
        .bind(1, key.canonical())
        .bind(2, to_unix(key.time))
        .bind(3, to_unix(key.end_time))
        .bind_opt(4, key.mp_id)
        .bind_opt(5, key.source)
        .bind_opt(6, key.radar)
        .bind_opt(7, key.domain)
        .bind_opt(8, key.method)
        .bind_opt(9, key.hydrometeor)
        .run();
    return store_.last_insert_rowid();
}

LinkResult DatasetLinker::attach(const IdentityKey& key,
                                 const std::string& role,
                                 const FileRecord& file,
                                 const std::map<std::string, std::string>& attrs) {
    const auto matches = find(key);
    if (matches.size() > 1) {
        Logger::log(LogLevel::Error,
                    std::to_string(matches.size()) + " datasets share identity " + key.canonical(), "linker");
        throw DuplicateDatasetError(key.canonical(), file.path, matches.size());
    }

    LinkResult result;
    if (matches.empty()) {
        result.dataset_id = insert_dataset(key);
        result.created = true;
    } else {
        result.dataset_id = matches.front();
    }

    store_.prepare(
        "INSERT INTO dataset_file(dataset_id, role, file_id) VALUES(?, ?, ?) "
        "ON CONFLICT(dataset_id, role) DO UPDATE SET file_id = excluded.file_id;")
        .bind(1, result.dataset_id).bind(2, role).bind(3, file.id).run();

    if (!attrs.empty()) {
        auto upsert = store_.prepare(
            "INSERT INTO dataset_attribute(dataset_id, name, value) VALUES(?, ?, ?) "
            "ON CONFLICT(dataset_id, name) DO UPDATE SET value = excluded.value;");
        for (const auto& [name, value] : attrs) {
            upsert.bind(1, result.dataset_id).bind(2, name).bind(3, value).run();
            upsert.reset();
        }
    }

    Logger::log(LogLevel::Debug,
                std::string(result.created ? "Created" : "Updated") + " dataset " +
                std::to_string(result.dataset_id) + " role " + role + " <- " + file.path.string(),
                "linker");
    return result;
}

std::optional<FileLink> DatasetLinker::link_of(const std::int64_t file_id) const {
    auto q = store_.prepare(
        "SELECT dataset_id, role FROM dataset_file WHERE file_id = ? ORDER BY dataset_id LIMIT 1;");
    q.bind(1, file_id);
    if (!q.step()) return std::nullopt;
    return FileLink{q.column_int64(0), q.column_text(1)};
}

std::optional<IdentityKey> DatasetLinker::identity_of(const std::int64_t dataset_id) const {
    auto q = store_.prepare(
        "SELECT time, end_time, mp_id, source, radar, domain, method, hydrometeor "
        "FROM dataset WHERE id = ?;");
    q.bind(1, dataset_id);
    if (!q.step()) return std::nullopt;
    IdentityKey key;
    key.time = from_unix(q.column_int64(0));
    key.end_time = from_unix(q.column_int64(1));
    key.mp_id = q.column_opt_int64(2);
    key.source = q.column_opt_text(3);
    key.radar = q.column_opt_text(4);
    key.domain = q.column_opt_text(5);
    key.method = q.column_opt_text(6);
    key.hydrometeor = q.column_opt_text(7);
    return key;
}

void DatasetLinker::detach(const FileLink& link) {
    store_.prepare("DELETE FROM dataset_file WHERE dataset_id = ? AND role = ?;")
        .bind(1, link.dataset_id).bind(2, link.role).run();
    Logger::log(LogLevel::Debug,
                "Detached role " + link.role + " from dataset " + std::to_string(link.dataset_id), "linker");
}

} // namespace datacat
