//
// Created by Giuseppe Francione on 05/10/26.
//

#include "../../include/layout_parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace datacat {

LayoutParser::LayoutParser(Options options)
    : options_(std::move(options)),
      time_re_(options_.time_pattern, std::regex::ECMAScript) {
    if (!options_.domain_pattern.empty()) {
        domain_re_.emplace(options_.domain_pattern, std::regex::ECMAScript);
    }
}

std::optional<std::string> LayoutParser::lookup(const std::string_view category,
                                                const std::string_view value) const {
    for (const auto& ref : options_.reference) {
        if (ref.category == category && (ref.code == value || ref.label == value)) {
            return ref.label;
        }
    }
    return std::nullopt;
}

std::optional<std::string> LayoutParser::resolve(const Field field,
                                                 const std::vector<std::string>& dirs,
                                                 const std::string& filename) const {
    const std::string_view category = field_category(field);

    if (field == Field::MpId) {
        for (const auto& dir : dirs) {
            if (dir.size() < 3 || !dir.starts_with("MP")) continue;
            const std::string id = dir.substr(2);
            if (!std::all_of(id.begin(), id.end(), [](const char c) { return c >= '0' && c <= '9'; }))
                continue;
            // MP<id> only counts for a known scheme id
            for (const auto& ref : options_.reference) {
                if (ref.category == category && ref.code == id) return id;
            }
        }
        return std::nullopt;
    }

    if (field == Field::Domain && domain_re_) {
        std::smatch m;
        if (std::regex_search(filename, m, *domain_re_) && m.size() > 1) {
            return lookup(category, m[1].str());
        }
    }

    for (const auto& dir : dirs) {
        if (auto label = lookup(category, dir)) return label;
    }
    return std::nullopt;
}

ParsedFile LayoutParser::parse(const ParseRequest& request) const {
    const std::string filename = request.path.filename().string();

    {
        std::ifstream in(request.path, std::ios::binary);
        if (!in) {
            throw ParseError("cannot read " + request.path.string());
        }
    }
    std::error_code ec;
    const std::string mime = MimeDetector::detect(request.path);
    if (fs::file_size(request.path, ec) == 0 || MimeDetector::is_empty_type(mime)) {
        throw ParseError("empty file " + request.path.string());
    }

    std::smatch m;
    if (!std::regex_search(filename, m, time_re_) || m.size() < 2) {
        throw ParseError("no time stamp in " + filename);
    }
    const auto time = parse_time(m[1].str(), options_.time_format);
    if (!time) {
        throw ParseError("invalid time stamp '" + m[1].str() + "' in " + filename);
    }

    std::vector<std::string> dirs;
    for (const auto& part : request.relative.parent_path()) {
        dirs.push_back(part.string());
    }

    ParsedFile parsed;
    parsed.role = request.kind.role;
    parsed.key.time = *time;
    parsed.key.end_time = *time;

    for (const auto& [field, value] : options_.constants) {
        parsed.key.set(field, value);
    }
    for (const Field field : options_.required) {
        if (options_.constants.contains(field)) continue;
        auto value = resolve(field, dirs, filename);
        if (!value) {
            throw ParseError("no known " + std::string(field_name(field)) +
                             " in " + request.relative.string());
        }
        parsed.key.set(field, *value);
    }
    for (const Field field : options_.optional) {
        if (options_.constants.contains(field)) continue;
        if (auto value = resolve(field, dirs, filename)) {
            parsed.key.set(field, *value);
        }
    }

    if (!mime.empty()) {
        parsed.attributes["mime_" + request.kind.role] = mime;
    }

    Logger::log(LogLevel::Debug,
                "Parsed " + request.relative.string() + " -> " + parsed.key.canonical(), "parser");
    return parsed;
}

} // namespace datacat
