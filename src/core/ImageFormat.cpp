#include "ImageFormat.h"
#include "Common.h"

namespace ImageConverter {

namespace {

struct Alias {
    const char* alias;
    ImageFormat::Id id;
};

// Accepted spellings besides the canonical names
const Alias ALIASES[] = {
    {"jpg", ImageFormat::Id::JPEG},
    {"tif", ImageFormat::Id::TIFF},
};

} // namespace

const std::vector<ImageFormat>& ImageFormat::all() {
    static const std::vector<ImageFormat> formats = {
        {Id::PNG,  "png",  ".png",  true,  true,  false},
        {Id::JPEG, "jpeg", ".jpg",  false, false, false},
        {Id::TIFF, "tiff", ".tif",  true,  true,  false},
        {Id::BMP,  "bmp",  ".bmp",  false, false, false},
        {Id::WEBP, "webp", ".webp", true,  false, false},
        {Id::HDR,  "hdr",  ".hdr",  false, false, true},
        {Id::EXR,  "exr",  ".exr",  true,  false, true},
    };
    return formats;
}

std::optional<ImageFormat> ImageFormat::fromString(const std::string& identifier) {
    std::string key = to_lower(identifier);
    if (!key.empty() && key.front() == '.') {
        key.erase(0, 1);
    }
    if (key.empty()) {
        return std::nullopt;
    }

    for (const auto& format : all()) {
        if (format.name == key) {
            return format;
        }
    }
    for (const auto& alias : ALIASES) {
        if (key == alias.alias) {
            for (const auto& format : all()) {
                if (format.id == alias.id) {
                    return format;
                }
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> ImageFormat::names() {
    std::vector<std::string> result;
    for (const auto& format : all()) {
        result.push_back(format.name);
    }
    return result;
}

const std::vector<std::string>& ImageFormat::sourceExtensions() {
    static const std::vector<std::string> extensions = [] {
        std::vector<std::string> exts;
        for (const auto& format : all()) {
            exts.push_back(format.extension);
        }
        exts.push_back(".jpeg");
        exts.push_back(".tiff");
        return exts;
    }();
    return extensions;
}

bool ImageFormat::isImageExtension(const std::string& extension) {
    std::string ext = to_lower(extension);
    if (!ext.empty() && ext.front() != '.') {
        ext = "." + ext;
    }
    const auto& exts = sourceExtensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

} // namespace ImageConverter
