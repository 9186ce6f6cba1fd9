#ifndef IMAGE_CONVERTER_BATCH_CONVERTER_H
#define IMAGE_CONVERTER_BATCH_CONVERTER_H

#include <cstddef>
#include <functional>

#include "Common.h"
#include "ConversionTypes.h"
#include "ImageCodec.h"
#include "ImageFormat.h"

namespace ImageConverter {

/**
 * @brief Converts every file of a ConversionRequest through an ImageCodec and
 * collects one outcome per file.
 *
 * Runs sequentially on the calling thread. A failing file never stops the
 * batch; only an invalid request does, and that is reported before any file
 * is touched.
 */
class BatchConverter {
public:
    /**
     * @brief Called after each file with the number of files finished so far.
     */
    using ProgressCallback = std::function<void(std::size_t completed, std::size_t total, const ConversionOutcome& outcome)>;

    explicit BatchConverter(ImageCodec& codec);

    /**
     * @brief Converts all sources of the request.
     * @param request Sources, target format, destination directory and encoder options.
     * @param onProgress Optional per-file notification.
     * @return One outcome per source, in request order. A source whose output
     *         was already written by a different source in the same batch is
     *         recorded as failed and left unconverted.
     * @throws ValidationError if the request has no sources, names an unsupported
     *         format, or the destination is missing, not a directory or not writable.
     */
    BatchReport convertBatch(const ConversionRequest& request, const ProgressCallback& onProgress = nullptr) const;

    /**
     * @brief Checks the request without converting anything.
     * @return The resolved target format.
     * @throws ValidationError as convertBatch.
     */
    static ImageFormat validate(const ConversionRequest& request);

    /**
     * @brief <destinationDir>/<source stem><format extension>
     */
    static fs::path destinationFor(const fs::path& source, const fs::path& destinationDir, const ImageFormat& format);

    /**
     * @brief Absolute, normalized form used to tell repeated sources from
     * distinct files that share a name.
     */
    static fs::path sourceIdentity(const fs::path& source);

private:
    ConversionOutcome convertOne(const fs::path& source, const fs::path& destination,
                                 const ImageFormat& format, const EncodeOptions& options) const;

    ImageCodec& m_codec;
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_BATCH_CONVERTER_H
