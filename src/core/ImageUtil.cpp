#include "ImageUtil.h"
#include "ImageFormat.h"
#include "Common.h"
#include "utils/Logging.h"

#include <iomanip>
#include <sstream>
#include <system_error>
#include <opencv2/imgcodecs.hpp> // Requires OpenCV dependency

namespace ImageConverter {

std::optional<ImageInfo> ImageUtil::readImageInfo(const fs::path& imagePath) {
    std::error_code ec;
    if (!fs::is_regular_file(imagePath, ec)) {
        return std::nullopt;
    }

    cv::Mat img;
    try {
        img = cv::imread(imagePath.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        qCWarning(lcCodec) << "Failed to read" << imagePath.string().c_str() << ":" << e.err.c_str();
        return std::nullopt;
    }
    if (img.empty()) {
        return std::nullopt;
    }

    ImageInfo info;
    info.width = img.cols;
    info.height = img.rows;
    info.channels = img.channels();
    info.bitDepth = static_cast<int>(img.elemSize1() * 8);

    info.fileSize = fs::file_size(imagePath, ec);
    if (ec) {
        info.fileSize = 0;
    }

    const std::string ext = imagePath.extension().string();
    if (auto format = ImageFormat::fromString(ext)) {
        info.format = format->name;
    } else {
        info.format = to_lower(ext);
    }
    return info;
}

std::string ImageUtil::formatFileSize(std::uintmax_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream ss;
    if (unit == 0) {
        ss << bytes << " " << units[unit];
    } else {
        ss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    }
    return ss.str();
}

} // namespace ImageConverter
