#ifndef IMAGE_CONVERTER_OPENCV_CODEC_H
#define IMAGE_CONVERTER_OPENCV_CODEC_H

#include <vector>
#include <opencv2/core.hpp> // Requires OpenCV dependency

#include "ImageCodec.h"

namespace ImageConverter {

/**
 * @brief ImageCodec backed by OpenCV imgcodecs.
 */
class OpenCvCodec : public ImageCodec {
public:
    void decodeThenEncode(const fs::path& source,
                          const fs::path& destination,
                          const ImageFormat& format,
                          const EncodeOptions& options) override;

    /**
     * @brief Adapts decoded pixels to what the target format can store:
     * alpha is composited over the background colour for formats without
     * alpha, float pixels are tone-mapped for integer formats, and the bit
     * depth is scaled to the format's range.
     */
    static cv::Mat prepareForFormat(const cv::Mat& image, const ImageFormat& format,
                                    const EncodeOptions& options = EncodeOptions());

    /**
     * @brief Composites a 4-channel image onto a solid background.
     */
    static cv::Mat removeAlphaChannel(const cv::Mat& src, const RgbColor& background = RgbColor());

    /**
     * @brief Maps radiance to [0, 1): v * exposure / (1 + v * exposure),
     * then gamma correction. Alpha, if present, is passed through.
     * @return CV_32F image with the input's channel count.
     */
    static cv::Mat toneMap(const cv::Mat& image, double exposure, double gamma);

    /**
     * @brief imwrite parameters for the format (quality, compression).
     */
    static std::vector<int> encodeParams(const ImageFormat& format, const EncodeOptions& options);

    /**
     * @brief Temporary sibling used while writing: <dir>/.<stem>.partial<ext>
     * The stem is shortened when needed so the name stays within 255 bytes.
     */
    static fs::path partialPathFor(const fs::path& destination);
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_OPENCV_CODEC_H
