//
// Created by Giuseppe Francione on 05/10/26.
//

#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

namespace {

// libmagic handles are not thread-safe, every call opens its own
std::string magic_mime(const std::filesystem::path& path) {
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0) {
        Logger::log(LogLevel::Debug,
                    std::string("magic_load failed: ") + magic_error(magic), "parser");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

} // namespace

std::string datacat::MimeDetector::detect(const std::filesystem::path& path) {
    return magic_mime(path);
}

bool datacat::MimeDetector::is_empty_type(const std::string_view mime) noexcept {
    return mime == "application/x-empty" || mime == "inode/x-empty";
}
