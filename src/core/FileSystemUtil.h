#ifndef IMAGE_CONVERTER_FILESYSTEM_UTIL_H
#define IMAGE_CONVERTER_FILESYSTEM_UTIL_H

#include <string>
#include <vector>
#include <filesystem> // Requires C++17 or later

namespace ImageConverter {

class FileSystemUtil {
public:
    enum class SourceState {
        Readable,
        NotFound,
        Unreadable
    };

    /**
     * @brief Classifies a source path: missing, present but not a readable
     * regular file, or readable.
     */
    static SourceState checkSource(const std::filesystem::path& path);

    /**
     * @brief True if the path is an existing directory the process may create files in.
     */
    static bool isWritableDirectory(const std::filesystem::path& path);

    /**
     * @brief Resolves a path to its absolute, canonical form.
     */
    static std::filesystem::path resolvePath(const std::filesystem::path& path);

    /**
     * @brief Gets all image files (by extension) in a directory, sorted by path.
     * @param directory The directory to search.
     * @param recursive Whether to search subdirectories.
     */
    static std::vector<std::filesystem::path> getImageFiles(const std::filesystem::path& directory, bool recursive = false);

    /**
     * @brief Expands a mixed list of files and directories into a flat list of files.
     * Files are kept as given (even if missing, so they surface as failed outcomes);
     * directories are replaced by the image files they contain.
     */
    static std::vector<std::filesystem::path> expandInputs(const std::vector<std::filesystem::path>& inputs, bool recursive = false);
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_FILESYSTEM_UTIL_H
