//
// Created by Giuseppe Francione on 04/10/26.
//

#include "../../include/file_kind.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace datacat {

bool is_junk_file(const fs::path& path) {
    auto name = path.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini";
}

KindTable::KindTable(std::vector<KindRule> rules, std::vector<std::string> excluded_suffixes)
    : rules_(std::move(rules)), excluded_suffixes_(std::move(excluded_suffixes)) {
    patterns_.reserve(rules_.size());
    for (const auto& rule : rules_) {
        if (rule.name_pattern.empty()) {
            patterns_.emplace_back();
        } else {
            patterns_.emplace_back(rule.name_pattern, std::regex::ECMAScript);
        }
    }
}

KindMatch KindTable::classify(const fs::path& path) const {
    const std::string name = path.filename().string();
    if (is_junk_file(path)) {
        return {Classification::Unrecognized, nullptr, "junk file"};
    }
    for (const auto& suffix : excluded_suffixes_) {
        if (name.ends_with(suffix)) {
            return {Classification::Excluded, nullptr, "excluded by product (*" + suffix + ")"};
        }
    }
    for (size_t i = 0; i < rules_.size(); ++i) {
        const auto& rule = rules_[i];
        if (!name.starts_with(rule.prefix) || !name.ends_with(rule.suffix)) continue;
        if (!rule.name_pattern.empty() && !std::regex_match(name, patterns_[i])) {
            return {Classification::Malformed, &rule,
                    "name does not follow the " + rule.kind + " pattern"};
        }
        return {Classification::Accepted, &rule, {}};
    }
    return {Classification::Unrecognized, nullptr, "not a data file of this product"};
}

} // namespace datacat
