#ifndef IMAGE_CONVERTER_CLI_RUNNER_H
#define IMAGE_CONVERTER_CLI_RUNNER_H

#include <ostream>

#include "core/ImageCodec.h"
#include "core/RequestSource.h"

namespace ImageConverter {

/**
 * @brief Runs the headless 'convert' command: one request, one batch, one
 * line per file on the output stream, then the summary.
 */
class CliRunner {
public:
    CliRunner(ImageCodec& codec, std::ostream& out, std::ostream& err);

    /**
     * @brief Converts the request the source yields.
     * @return Definitions::EXIT_ALL_CONVERTED if every file converted,
     *         EXIT_SOME_FAILED if at least one failed, EXIT_USAGE_ERROR if
     *         there was nothing to convert or the request was rejected.
     */
    int run(RequestSource& source);

private:
    ImageCodec& m_codec;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_CLI_RUNNER_H
