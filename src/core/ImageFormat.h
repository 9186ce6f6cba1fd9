#ifndef IMAGE_CONVERTER_IMAGE_FORMAT_H
#define IMAGE_CONVERTER_IMAGE_FORMAT_H

#include <optional>
#include <string>
#include <vector>

namespace ImageConverter {

/**
 * @brief One entry of the fixed table of target formats the converter can write.
 */
struct ImageFormat {
    enum class Id {
        PNG,
        JPEG,
        TIFF,
        BMP,
        WEBP,
        HDR,
        EXR
    };

    Id id;
    std::string name;       // canonical identifier, e.g. "jpeg"
    std::string extension;  // with leading dot, e.g. ".jpg"
    bool supportsAlpha;
    bool supports16Bit;
    bool floatingPoint;     // encoder stores float pixels (Radiance HDR, OpenEXR)

    bool operator==(const ImageFormat& other) const { return id == other.id; }
    bool operator!=(const ImageFormat& other) const { return id != other.id; }

    /**
     * @brief Looks up a format by identifier or alias ("jpg", ".TIF", "Jpeg", ...).
     * @return The format, or std::nullopt if the identifier is not supported.
     */
    static std::optional<ImageFormat> fromString(const std::string& identifier);

    /**
     * @brief All supported target formats, in display order.
     */
    static const std::vector<ImageFormat>& all();

    /**
     * @brief Canonical identifiers of all() ("png", "jpeg", ...).
     */
    static std::vector<std::string> names();

    /**
     * @brief File extensions recognised as image sources, with leading dots.
     * Includes the long spellings ".jpeg" and ".tiff".
     */
    static const std::vector<std::string>& sourceExtensions();

    /**
     * @brief True if the path's extension is one of sourceExtensions() (case-insensitive).
     */
    static bool isImageExtension(const std::string& extension);
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_IMAGE_FORMAT_H
