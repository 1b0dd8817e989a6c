//
// Created by Giuseppe Francione on 03/10/26.
//

#include "../../include/records.hpp"
#include <charconv>
#include <stdexcept>

namespace datacat {

std::string_view field_name(const Field field) noexcept {
    switch (field) {
        case Field::MpId:        return "mp_id";
        case Field::Source:      return "source";
        case Field::Radar:       return "radar";
        case Field::Domain:      return "domain";
        case Field::Method:      return "method";
        case Field::Hydrometeor: return "hydrometeor";
    }
    return "";
}

std::string_view field_category(const Field field) noexcept {
    switch (field) {
        case Field::MpId:        return "mp_scheme";
        case Field::Source:      return "source";
        case Field::Radar:       return "radar";
        case Field::Domain:      return "domain";
        case Field::Method:      return "method";
        case Field::Hydrometeor: return "hydrometeor";
    }
    return "";
}

const std::vector<Field>& all_fields() {
    static const std::vector<Field> fields = {
        Field::MpId, Field::Source, Field::Radar,
        Field::Domain, Field::Method, Field::Hydrometeor
    };
    return fields;
}

namespace {

// IdentityKey or const IdentityKey
template<class Key>
auto text_member(Key& key, const Field field) -> decltype(&key.source) {
    switch (field) {
        case Field::Source:      return &key.source;
        case Field::Radar:       return &key.radar;
        case Field::Domain:      return &key.domain;
        case Field::Method:      return &key.method;
        case Field::Hydrometeor: return &key.hydrometeor;
        case Field::MpId:        break;
    }
    return nullptr;
}

} // namespace

std::optional<std::string> IdentityKey::get(const Field field) const {
    if (field == Field::MpId) {
        if (!mp_id) return std::nullopt;
        return std::to_string(*mp_id);
    }
    return *text_member(*this, field);
}

void IdentityKey::set(const Field field, const std::string& value) {
    if (field == Field::MpId) {
        std::int64_t id = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), id);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            throw std::invalid_argument("mp_id is not numeric: '" + value + "'");
        }
        mp_id = id;
        return;
    }
    *text_member(*this, field) = value;
}

namespace {

void append_escaped(std::string& out, const std::string& value) {
    for (const char c : value) {
        if (c == '\\' || c == ';' || c == '=') out += '\\';
        out += c;
    }
}

} // namespace

std::string IdentityKey::canonical() const {
    std::string out = "time=" + std::to_string(to_unix(time)) +
                      ";end=" + std::to_string(to_unix(end_time));
    for (const Field f : all_fields()) {
        const auto value = get(f);
        if (!value) continue;
        out += ';';
        out += f == Field::Hydrometeor ? "hm" : field_name(f);
        out += '=';
        append_escaped(out, *value);
    }
    return out;
}

std::optional<std::string> QueryFilter::get(const Field field) const {
    switch (field) {
        case Field::MpId:
            if (!mp_id) return std::nullopt;
            return std::to_string(*mp_id);
        case Field::Source:      return source;
        case Field::Radar:       return radar;
        case Field::Domain:      return domain;
        case Field::Method:      return method;
        case Field::Hydrometeor: return hydrometeor;
    }
    return std::nullopt;
}

std::string attribute_to_string(const AttributeValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i);
    return format_time(std::get<TimePoint>(value));
}

} // namespace datacat
