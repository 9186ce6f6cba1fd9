#ifndef IMAGE_CONVERTER_CLI_REQUEST_SOURCE_H
#define IMAGE_CONVERTER_CLI_REQUEST_SOURCE_H

#include "ArgParser.h"
#include "core/RequestSource.h"

namespace ImageConverter {

/**
 * @brief Builds the request from the parsed 'convert' command.
 *
 * Directories among the inputs are replaced by the image files they contain.
 * Yields its request once; later calls return std::nullopt.
 */
class CliRequestSource : public RequestSource {
public:
    /**
     * @param defaults Encoder options used where the command line gives none.
     */
    explicit CliRequestSource(const ArgParser::Arguments& args, const EncodeOptions& defaults = EncodeOptions());

    std::optional<ConversionRequest> nextRequest() override;

private:
    ArgParser::Arguments m_args;
    EncodeOptions m_defaults;
    bool m_consumed = false;
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_CLI_REQUEST_SOURCE_H
