#include "BatchConverter.h"
#include "FileSystemUtil.h"
#include "utils/Logging.h"

#include <chrono>
#include <map>
#include <system_error>
#include <utility>

namespace ImageConverter {

BatchConverter::BatchConverter(ImageCodec& codec)
    : m_codec(codec)
{
}

ImageFormat BatchConverter::validate(const ConversionRequest& request) {
    if (request.sources.empty()) {
        throw ValidationError("no source files selected");
    }

    auto format = ImageFormat::fromString(request.targetFormat);
    if (!format) {
        throw ValidationError("unsupported target format: " + request.targetFormat);
    }

    std::error_code ec;
    if (request.destinationDir.empty() || !fs::exists(request.destinationDir, ec)) {
        throw ValidationError("destination directory does not exist: " + request.destinationDir.string());
    }
    if (!fs::is_directory(request.destinationDir, ec)) {
        throw ValidationError("destination is not a directory: " + request.destinationDir.string());
    }
    if (!FileSystemUtil::isWritableDirectory(request.destinationDir)) {
        throw ValidationError("destination directory is not writable: " + request.destinationDir.string());
    }
    return *format;
}

fs::path BatchConverter::sourceIdentity(const fs::path& source) {
    std::error_code ec;
    fs::path absolute = fs::absolute(source, ec);
    return ec ? source.lexically_normal() : absolute.lexically_normal();
}

fs::path BatchConverter::destinationFor(const fs::path& source, const fs::path& destinationDir, const ImageFormat& format) {
    fs::path name = source.stem();
    name += format.extension;
    return destinationDir / name;
}

BatchReport BatchConverter::convertBatch(const ConversionRequest& request, const ProgressCallback& onProgress) const {
    const ImageFormat format = validate(request);
    const std::size_t total = request.sources.size();

    qCInfo(lcBatch) << "Converting" << total << "file(s) to" << format.name.c_str()
                    << "into" << request.destinationDir.string().c_str();

    std::vector<ConversionOutcome> outcomes;
    outcomes.reserve(total);

    // destination -> source that was written there in this batch
    std::map<fs::path, fs::path> claimed;

    for (const auto& source : request.sources) {
        const fs::path destination = destinationFor(source, request.destinationDir, format);
        const fs::path identity = sourceIdentity(source);
        auto it = claimed.find(destination);

        if (it != claimed.end() && it->second != identity) {
            qCWarning(lcBatch) << "Skipping" << source.string().c_str() << ": its output"
                               << destination.filename().string().c_str() << "is already written by"
                               << it->second.string().c_str();
            outcomes.push_back(ConversionOutcome::failure(source, destination,
                                                          "destination collides with " + it->second.string()));
        } else {
            outcomes.push_back(convertOne(source, destination, format, request.options));
            if (outcomes.back().ok()) {
                claimed.emplace(destination, identity);
            }
        }
        if (onProgress) {
            onProgress(outcomes.size(), total, outcomes.back());
        }
    }

    BatchReport report(std::move(outcomes));
    qCInfo(lcBatch) << report.summary().c_str();
    return report;
}

ConversionOutcome BatchConverter::convertOne(const fs::path& source, const fs::path& destination,
                                             const ImageFormat& format, const EncodeOptions& options) const
{
    const auto started = std::chrono::steady_clock::now();

    ConversionOutcome outcome;
    switch (FileSystemUtil::checkSource(source)) {
    case FileSystemUtil::SourceState::NotFound:
        outcome = ConversionOutcome::failure(source, destination, "source not found");
        break;
    case FileSystemUtil::SourceState::Unreadable:
        outcome = ConversionOutcome::failure(source, destination, "source unreadable");
        break;
    case FileSystemUtil::SourceState::Readable:
        try {
            m_codec.decodeThenEncode(source, destination, format, options);
            outcome = ConversionOutcome::success(source, destination);
        } catch (const std::exception& e) {
            outcome = ConversionOutcome::failure(source, destination, e.what());
        }
        break;
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (outcome.ok()) {
        qCInfo(lcBatch) << "Converted" << source.filename().string().c_str()
                        << "to" << destination.filename().string().c_str();
    } else {
        qCWarning(lcBatch) << "Failed" << source.string().c_str() << ":" << outcome.reason.c_str();
    }
    return outcome;
}

} // namespace ImageConverter
