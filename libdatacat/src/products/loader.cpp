//
// Created by Giuseppe Francione on 05/10/26.
//

#include "../../include/loader.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace datacat {

size_t RawFiles::total_bytes() const {
    size_t total = 0;
    for (const auto& [role, bytes] : contents) {
        total += bytes.size();
    }
    return total;
}

RawFiles load_raw_files(const FileMap& files) {
    RawFiles raw;
    for (const auto& [role, path] : files) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("cannot open " + path.string() + " (role " + role + ")");
        }
        std::vector<char> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            throw std::runtime_error("read error on " + path.string());
        }
        raw.contents.emplace(role, std::move(bytes));
    }
    return raw;
}

Loader raw_file_loader() {
    return [](const FileMap& files) -> std::any {
        return load_raw_files(files);
    };
}

} // namespace datacat
