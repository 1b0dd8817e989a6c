//
// Created by Giuseppe Francione on 09/10/26.
//

#include "../../include/result_handle.hpp"
#include "../../include/errors.hpp"
#include <exception>
#include <utility>

namespace datacat {

ResultHandle::ResultHandle(Attributes attributes, FileMap files, Loader loader)
    : attributes_(std::move(attributes)), files_(std::move(files)), loader_(std::move(loader)) {}

ResultHandle ResultHandle::from_record(const DatasetRecord& record, Loader loader) {
    Attributes attrs;
    // free-form values first, so the typed identity fields below win
    for (const auto& [name, value] : record.attributes) {
        attrs.insert_or_assign(name, value);
    }
    attrs.insert_or_assign("time", record.key.time);
    attrs.insert_or_assign("end_time", record.key.end_time);
    attrs.insert_or_assign("identity", record.key.canonical());
    if (record.key.mp_id) {
        attrs.insert_or_assign("mp_id", *record.key.mp_id);
    }
    for (const Field field : all_fields()) {
        if (field == Field::MpId) continue;
        if (auto value = record.key.get(field)) {
            attrs.insert_or_assign(std::string(field_name(field)), std::move(*value));
        }
    }

    FileMap files;
    for (const auto& [role, file] : record.roles) {
        files.emplace(role, file.path);
    }
    return {std::move(attrs), std::move(files), std::move(loader)};
}

std::optional<AttributeValue> ResultHandle::attribute(const std::string_view name) const {
    const auto it = attributes_.find(name);
    if (it == attributes_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::filesystem::path> ResultHandle::file(const std::string_view role) const {
    for (const auto& [r, path] : files_) {
        if (r == role) return path;
    }
    return std::nullopt;
}

TimePoint ResultHandle::time() const {
    const auto it = attributes_.find("time");
    if (it != attributes_.end()) {
        if (const auto* t = std::get_if<TimePoint>(&it->second)) return *t;
    }
    return TimePoint{};
}

Dataset ResultHandle::load() const {
    if (!loader_) {
        throw LoadError("no loader bound to this handle");
    }
    Dataset ds;
    try {
        ds.data = loader_(files_);
    } catch (const std::exception& e) {
        std::throw_with_nested(LoadError(std::string("loading dataset failed: ") + e.what()));
    }
    ds.attributes = attributes_;
    ds.files = files_;
    return ds;
}

} // namespace datacat
