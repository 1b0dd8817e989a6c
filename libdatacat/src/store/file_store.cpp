//
// Created by Giuseppe Francione on 07/10/26.
//

#include "../../include/file_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace fs = std::filesystem;

namespace datacat {

namespace {

constexpr int kSchemaVersion = 2;

constexpr auto kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS catalog_meta (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS file_kind (
    id   INTEGER PRIMARY KEY,
    name TEXT NOT NULL UNIQUE,
    role TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS reference_value (
    id       INTEGER PRIMARY KEY,
    category TEXT NOT NULL,
    code     TEXT NOT NULL,
    label    TEXT NOT NULL,
    UNIQUE (category, code)
);
CREATE TABLE IF NOT EXISTS datafile (
    id           INTEGER PRIMARY KEY,
    path         TEXT NOT NULL UNIQUE,
    kind_id      INTEGER NOT NULL REFERENCES file_kind(id),
    last_checked INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS dataset (
    id          INTEGER PRIMARY KEY,
    identity    TEXT NOT NULL,
    time        INTEGER NOT NULL,
    end_time    INTEGER NOT NULL,
    mp_id       INTEGER,
    source      TEXT,
    radar       TEXT,
    domain      TEXT,
    method      TEXT,
    hydrometeor TEXT
);
CREATE INDEX IF NOT EXISTS dataset_identity_idx ON dataset(identity);
CREATE INDEX IF NOT EXISTS dataset_time_idx ON dataset(time);
CREATE TABLE IF NOT EXISTS dataset_file (
    dataset_id INTEGER NOT NULL REFERENCES dataset(id),
    role       TEXT NOT NULL,
    file_id    INTEGER NOT NULL REFERENCES datafile(id),
    PRIMARY KEY (dataset_id, role)
);
CREATE INDEX IF NOT EXISTS dataset_file_file_idx ON dataset_file(file_id);
CREATE TABLE IF NOT EXISTS dataset_attribute (
    dataset_id INTEGER NOT NULL REFERENCES dataset(id),
    name       TEXT NOT NULL,
    value      TEXT NOT NULL,
    PRIMARY KEY (dataset_id, name)
);
)SQL";

void seed(SqliteStore& store, const ProductSchema& product) {
    auto kind = store.prepare("INSERT OR IGNORE INTO file_kind(name, role) VALUES(?, ?);");
    for (const auto& rule : product.kinds.rules()) {
        kind.bind(1, rule.kind).bind(2, rule.role).run();
        kind.reset();
    }
    kind.bind(1, kCorruptKind).bind(2, "").run();

    auto check = store.prepare("SELECT COUNT(*) FROM file_kind WHERE name = ?;");
    check.bind(1, kCorruptKind);
    if (!check.step() || check.column_int64(0) != 1) {
        throw StoreError(std::string("file kind '") + std::string(kCorruptKind) + "' was not seeded");
    }

    auto ref = store.prepare("INSERT OR IGNORE INTO reference_value(category, code, label) VALUES(?, ?, ?);");
    for (const auto& value : product.reference) {
        ref.bind(1, value.category).bind(2, value.code).bind(3, value.label).run();
        ref.reset();
    }
}

} // namespace

void initialize_store(SqliteStore& store, const ProductSchema& product) {
    try {
        Transaction tx(store);
        store.exec(kSchema);

        std::optional<std::string> bound;
        {
            auto q = store.prepare("SELECT value FROM catalog_meta WHERE key = 'product';");
            if (q.step()) bound = q.column_text(0);
        }
        if (bound && *bound != product.name) {
            throw OpenError("store " + store.path().string() + " belongs to product '" + *bound +
                            "', not '" + product.name + "'");
        }
        if (bound) {
            // identity strings of other versions do not match the ones computed now
            auto q = store.prepare("SELECT value FROM catalog_meta WHERE key = 'schema_version';");
            const std::string version = q.step() ? q.column_text(0) : std::string("?");
            if (version != std::to_string(kSchemaVersion)) {
                throw OpenError("store " + store.path().string() + " has schema version " + version +
                                ", expected " + std::to_string(kSchemaVersion) + "; re-create it");
            }
        }
        if (!bound) {
            store.prepare("INSERT INTO catalog_meta(key, value) VALUES('product', ?);")
                 .bind(1, product.name).run();
            store.prepare("INSERT INTO catalog_meta(key, value) VALUES('schema_version', ?);")
                 .bind(1, std::to_string(kSchemaVersion)).run();
            Logger::log(LogLevel::Info,
                        "Created store " + store.path().string() + " for product " + product.name, "store");
        }
        seed(store, product);
        tx.commit();
    } catch (const StoreError& e) {
        throw OpenError("cannot initialize store " + store.path().string() + ": " + e.what());
    }
}

std::optional<FileRecord> FileStore::find(const fs::path& path) const {
    auto q = store_.prepare(
        "SELECT f.id, f.path, k.name, f.last_checked FROM datafile f "
        "JOIN file_kind k ON k.id = f.kind_id WHERE f.path = ?;");
    q.bind(1, path.string());
    if (!q.step()) return std::nullopt;
    return FileRecord{q.column_int64(0), q.column_text(1), q.column_text(2), from_unix_nanos(q.column_int64(3))};
}

std::vector<FileRecord> FileStore::all() const {
    auto q = store_.prepare(
        "SELECT f.id, f.path, k.name, f.last_checked FROM datafile f "
        "JOIN file_kind k ON k.id = f.kind_id ORDER BY f.path;");
    std::vector<FileRecord> out;
    while (q.step()) {
        out.push_back({q.column_int64(0), q.column_text(1), q.column_text(2), from_unix_nanos(q.column_int64(3))});
    }
    return out;
}

std::map<std::string, FileRecord> FileStore::snapshot() const {
    std::map<std::string, FileRecord> out;
    for (auto& rec : all()) {
        auto key = rec.path.string();
        out.emplace(std::move(key), std::move(rec));
    }
    return out;
}

std::int64_t FileStore::kind_id(const std::string_view kind) const {
    auto q = store_.prepare("SELECT id FROM file_kind WHERE name = ?;");
    q.bind(1, kind);
    if (!q.step()) throw StoreError("unknown file kind '" + std::string(kind) + "'");
    return q.column_int64(0);
}

FileRecord FileStore::upsert(const fs::path& path, const std::string_view kind, const Watermark last_checked) {
    const auto kid = kind_id(kind);
    store_.prepare(
        "INSERT INTO datafile(path, kind_id, last_checked) VALUES(?, ?, ?) "
        "ON CONFLICT(path) DO UPDATE SET kind_id = excluded.kind_id, "
        "last_checked = excluded.last_checked;")
        .bind(1, path.string()).bind(2, kid).bind(3, to_unix_nanos(last_checked)).run();

    auto rec = find(path);
    if (!rec) throw StoreError("datafile row vanished for " + path.string());
    return *rec;
}

std::vector<ReferenceValue> FileStore::reference() const {
    auto q = store_.prepare("SELECT category, code, label FROM reference_value ORDER BY category, id;");
    std::vector<ReferenceValue> out;
    while (q.step()) {
        out.push_back({q.column_text(0), q.column_text(1), q.column_text(2)});
    }
    return out;
}

std::optional<std::string> FileStore::reference_label(const std::string_view category,
                                                      const std::string_view value) const {
    auto q = store_.prepare(
        "SELECT label FROM reference_value WHERE category = ? AND (code = ? OR label = ?) LIMIT 1;");
    q.bind(1, category).bind(2, value).bind(3, value);
    if (!q.step()) return std::nullopt;
    return q.column_text(0);
}

} // namespace datacat
