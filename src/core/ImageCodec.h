#ifndef IMAGE_CONVERTER_IMAGE_CODEC_H
#define IMAGE_CONVERTER_IMAGE_CODEC_H

#include "Common.h"
#include "ConversionTypes.h"
#include "ImageFormat.h"

namespace ImageConverter {

/**
 * @brief The single capability the batch converter needs from an imaging library.
 */
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    /**
     * @brief Decodes the source image and writes it to destination in the given format.
     *
     * Implementations must either write the complete destination file or leave
     * nothing behind.
     * @throws ConversionError with a human-readable reason on any failure.
     */
    virtual void decodeThenEncode(const fs::path& source,
                                  const fs::path& destination,
                                  const ImageFormat& format,
                                  const EncodeOptions& options) = 0;
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_IMAGE_CODEC_H
