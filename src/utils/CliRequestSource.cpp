#include "CliRequestSource.h"
#include "core/FileSystemUtil.h"
#include "Logging.h"

namespace ImageConverter {

CliRequestSource::CliRequestSource(const ArgParser::Arguments& args, const EncodeOptions& defaults)
    : m_args(args), m_defaults(defaults)
{
}

std::optional<ConversionRequest> CliRequestSource::nextRequest()
{
    if (m_consumed || m_args.command != "convert") {
        return std::nullopt;
    }
    m_consumed = true;

    std::vector<fs::path> inputs;
    for (const auto& input : m_args.vectorArgs["input_path"]) {
        inputs.emplace_back(input);
    }

    ConversionRequest request;
    request.sources = FileSystemUtil::expandInputs(inputs, m_args.boolArgs["recursive"]);
    request.targetFormat = m_args.stringArgs["output_format"];
    request.destinationDir = m_args.stringArgs["output_path"];
    request.options = m_defaults;

    auto quality = m_args.intArgs.find("quality");
    if (quality != m_args.intArgs.end()) {
        request.options.jpegQuality = quality->second;
        request.options.webpQuality = quality->second;
    }
    auto compression = m_args.intArgs.find("png_compression");
    if (compression != m_args.intArgs.end()) {
        request.options.pngCompression = compression->second;
    }
    auto exposure = m_args.doubleArgs.find("exposure");
    if (exposure != m_args.doubleArgs.end()) {
        request.options.exposure = exposure->second;
    }
    auto gamma = m_args.doubleArgs.find("gamma");
    if (gamma != m_args.doubleArgs.end()) {
        request.options.gamma = gamma->second;
    }
    auto background = m_args.stringArgs.find("background");
    if (background != m_args.stringArgs.end()) {
        // ArgParser has already rejected unparsable colours
        request.options.background = RgbColor::fromString(background->second).value_or(m_defaults.background);
    }

    if (request.sources.empty()) {
        qCWarning(lcBatch) << "Nothing to convert";
        return std::nullopt;
    }
    return request;
}

} // namespace ImageConverter
