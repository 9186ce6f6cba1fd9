#ifndef IMAGE_CONVERTER_REQUEST_SOURCE_H
#define IMAGE_CONVERTER_REQUEST_SOURCE_H

#include <optional>

#include "ConversionTypes.h"

namespace ImageConverter {

/**
 * @brief Anything that can hand the converter a batch to run: the command line,
 * the Convert tab, or a test harness.
 */
class RequestSource {
public:
    virtual ~RequestSource() = default;

    /**
     * @return The request, or std::nullopt if there is nothing to run
     *         (user cancelled, no input given).
     */
    virtual std::optional<ConversionRequest> nextRequest() = 0;
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_REQUEST_SOURCE_H
