//
// Created by Giuseppe Francione on 05/10/26.
//

#ifndef DATACAT_MIME_DETECTOR_HPP
#define DATACAT_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace datacat {

    /**
     * @brief Content-based file type detection backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A string representing the MIME type (e.g. "application/x-hdf5"),
         * or an empty string if libmagic could not be initialized.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Checks whether a type returned by detect() denotes an empty file.
         *
         * An undetectable type (empty string) is not treated as empty.
         */
        static bool is_empty_type(std::string_view mime) noexcept;
    };

} // namespace datacat
#endif //DATACAT_MIME_DETECTOR_HPP
