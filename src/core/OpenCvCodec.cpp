#include "OpenCvCodec.h"
#include "utils/Logging.h"

#include <algorithm>
#include <string>
#include <system_error>
#include <opencv2/imgcodecs.hpp>

namespace ImageConverter {

namespace {

constexpr std::size_t MAX_FILE_NAME = 255;
const std::string PARTIAL_MARKER = ".partial";

double maxValueForDepth(int depth) {
    switch (depth) {
    case CV_8U:  return 255.0;
    case CV_16U: return 65535.0;
    default:     return 1.0;
    }
}

// Removes a leftover temporary; failure to do so is logged, not fatal
void discardPartial(const fs::path& partial) {
    std::error_code ec;
    if (fs::exists(partial, ec) && !fs::remove(partial, ec)) {
        qCWarning(lcCodec) << "Could not remove temporary file" << partial.string().c_str()
                           << ":" << ec.message().c_str();
    }
}

} // namespace

cv::Mat OpenCvCodec::removeAlphaChannel(const cv::Mat& src, const RgbColor& background) {
    if (src.channels() != 4) return src;

    const double maxVal = maxValueForDepth(src.depth());
    // OpenCV channel order
    const double fill[3] = {
        background.blue / 255.0 * maxVal,
        background.green / 255.0 * maxVal,
        background.red / 255.0 * maxVal,
    };

    std::vector<cv::Mat> channels;
    cv::split(src, channels);

    cv::Mat alpha;
    channels[3].convertTo(alpha, CV_32F, 1.0 / maxVal);
    cv::Mat inverse = 1.0 - alpha;

    // dst = src * alpha + background * (1 - alpha)
    std::vector<cv::Mat> blended(3);
    for (int i = 0; i < 3; ++i) {
        cv::Mat c;
        channels[i].convertTo(c, CV_32F);
        blended[i] = c.mul(alpha) + inverse * fill[i];
    }

    cv::Mat dst;
    cv::merge(blended, dst);
    dst.convertTo(dst, src.depth());
    return dst;
}

cv::Mat OpenCvCodec::toneMap(const cv::Mat& image, double exposure, double gamma) {
    std::vector<cv::Mat> channels;
    cv::split(image, channels);

    const bool hasAlpha = channels.size() == 2 || channels.size() == 4;
    const std::size_t colorChannels = hasAlpha ? channels.size() - 1 : channels.size();
    const double invGamma = gamma > 0.0 ? 1.0 / gamma : 1.0;

    for (std::size_t i = 0; i < channels.size(); ++i) {
        cv::Mat c;
        if (i >= colorChannels) {
            channels[i].convertTo(c, CV_32F);
        } else {
            channels[i].convertTo(c, CV_32F, exposure);
            c = cv::max(c, 0.0);
            cv::Mat denominator = c + 1.0;
            cv::divide(c, denominator, c);
            cv::pow(c, invGamma, c);
        }
        channels[i] = c;
    }

    cv::Mat mapped;
    cv::merge(channels, mapped);
    return mapped;
}

cv::Mat OpenCvCodec::prepareForFormat(const cv::Mat& image, const ImageFormat& format, const EncodeOptions& options) {
    cv::Mat img = image;

    if (img.channels() == 4 && !format.supportsAlpha) {
        img = removeAlphaChannel(img, options.background);
    }

    const int depth = img.depth();
    if (format.floatingPoint) {
        if (depth != CV_32F) {
            img.convertTo(img, CV_32F, 1.0 / maxValueForDepth(depth));
        }
    } else if (depth == CV_32F || depth == CV_64F) {
        qCDebug(lcCodec) << "Tone mapping float pixels, exposure" << options.exposure << "gamma" << options.gamma;
        cv::Mat mapped = toneMap(img, options.exposure, options.gamma);
        if (format.supports16Bit) {
            mapped.convertTo(img, CV_16U, 65535.0);
        } else {
            mapped.convertTo(img, CV_8U, 255.0);
        }
    } else if (depth == CV_16U && !format.supports16Bit) {
        img.convertTo(img, CV_8U, 1.0 / 257.0);
    } else if (depth != CV_8U && depth != CV_16U) {
        img.convertTo(img, CV_8U);
    }
    return img;
}

std::vector<int> OpenCvCodec::encodeParams(const ImageFormat& format, const EncodeOptions& options) {
    switch (format.id) {
    case ImageFormat::Id::JPEG:
        return {cv::IMWRITE_JPEG_QUALITY, std::clamp(options.jpegQuality, 0, 100)};
    case ImageFormat::Id::PNG:
        return {cv::IMWRITE_PNG_COMPRESSION, std::clamp(options.pngCompression, 0, 9)};
    case ImageFormat::Id::WEBP:
        return {cv::IMWRITE_WEBP_QUALITY, std::clamp(options.webpQuality, 1, 100)};
    default:
        return {};
    }
}

fs::path OpenCvCodec::partialPathFor(const fs::path& destination) {
    std::string stem = destination.stem().string();
    const std::string extension = destination.extension().string();

    const std::size_t length = 1 + stem.size() + PARTIAL_MARKER.size() + extension.size();
    if (length > MAX_FILE_NAME) {
        std::size_t keep = stem.size() > length - MAX_FILE_NAME ? stem.size() - (length - MAX_FILE_NAME) : 0;
        // Do not split a UTF-8 sequence
        while (keep > 0 && (static_cast<unsigned char>(stem[keep]) & 0xC0) == 0x80) {
            --keep;
        }
        stem.resize(keep);
    }
    return destination.parent_path() / ("." + stem + PARTIAL_MARKER + extension);
}

void OpenCvCodec::decodeThenEncode(const fs::path& source,
                                   const fs::path& destination,
                                   const ImageFormat& format,
                                   const EncodeOptions& options)
{
    cv::Mat img;
    try {
        img = cv::imread(source.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw ConversionError("unable to decode image: " + e.err);
    }
    if (img.empty()) {
        throw ConversionError("unable to decode image");
    }
    qCDebug(lcCodec) << "Decoded" << source.filename().string().c_str()
                     << img.cols << "x" << img.rows << "channels:" << img.channels();

    cv::Mat prepared;
    try {
        prepared = prepareForFormat(img, format, options);
    } catch (const cv::Exception& e) {
        throw ConversionError("unsupported pixel layout: " + e.err);
    }

    const fs::path partial = partialPathFor(destination);
    bool written = false;
    try {
        written = cv::imwrite(partial.string(), prepared, encodeParams(format, options));
    } catch (const cv::Exception& e) {
        discardPartial(partial);
        throw ConversionError("unable to encode " + format.name + ": " + e.err);
    }
    if (!written) {
        discardPartial(partial);
        throw ConversionError("unable to write " + format.name + " file");
    }

    std::error_code ec;
    fs::rename(partial, destination, ec);
    if (ec) {
        discardPartial(partial);
        throw ConversionError("unable to move output into place: " + ec.message());
    }
}

} // namespace ImageConverter
