#ifndef IMAGE_CONVERTER_IMAGE_UTIL_H
#define IMAGE_CONVERTER_IMAGE_UTIL_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ImageConverter {

/**
 * @brief Basic properties of an image file, for display.
 */
struct ImageInfo {
    int width = 0;
    int height = 0;
    int channels = 0;
    int bitDepth = 0;          // bits per channel
    std::uintmax_t fileSize = 0;
    std::string format;        // canonical format name from the extension, or the raw extension
};

class ImageUtil {
public:
    /**
     * @brief Reads the header and pixels of an image to describe it.
     * @return std::nullopt if the file is missing or cannot be decoded.
     */
    static std::optional<ImageInfo> readImageInfo(const std::filesystem::path& imagePath);

    /**
     * @brief Human readable size, e.g. "1.4 MB".
     */
    static std::string formatFileSize(std::uintmax_t bytes);
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_IMAGE_UTIL_H
