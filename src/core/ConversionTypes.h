#ifndef IMAGE_CONVERTER_CONVERSION_TYPES_H
#define IMAGE_CONVERTER_CONVERSION_TYPES_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Common.h"

namespace ImageConverter {

/**
 * @brief 8-bit RGB colour.
 */
struct RgbColor {
    int red = 255;
    int green = 255;
    int blue = 255;

    bool operator==(const RgbColor& other) const {
        return red == other.red && green == other.green && blue == other.blue;
    }

    /**
     * @brief Parses "#RRGGBB", "RRGGBB" or "R,G,B" (components 0-255).
     */
    static std::optional<RgbColor> fromString(const std::string& text);

    /**
     * @brief Lower-case "#rrggbb".
     */
    std::string toHex() const;
};

/**
 * @brief Encoder tuning passed through to the codec.
 */
struct EncodeOptions {
    int jpegQuality = 95;     // 0-100
    int pngCompression = 3;   // 0-9
    int webpQuality = 90;     // 1-100
    double exposure = 1.0;    // radiance multiplier before tone mapping
    double gamma = 2.2;       // tone-mapping gamma for float sources
    RgbColor background;      // fill behind transparent pixels when alpha is dropped
};

/**
 * @brief One batch of work: which files, into which format, written where.
 */
struct ConversionRequest {
    std::vector<fs::path> sources;
    std::string targetFormat;   // identifier, validated by BatchConverter
    fs::path destinationDir;
    EncodeOptions options;
};

/**
 * @brief Result of attempting one source file.
 */
struct ConversionOutcome {
    enum class Status {
        Success,
        Failed
    };

    fs::path source;
    fs::path destination;
    Status status = Status::Failed;
    std::string reason;   // empty on success
    std::chrono::milliseconds elapsed{0};

    bool ok() const { return status == Status::Success; }

    static ConversionOutcome success(const fs::path& source, const fs::path& destination);
    static ConversionOutcome failure(const fs::path& source, const fs::path& destination, const std::string& reason);
};

/**
 * @brief Outcomes of one batch, one per requested source, in request order.
 */
class BatchReport {
public:
    BatchReport() = default;
    explicit BatchReport(std::vector<ConversionOutcome> outcomes);

    const std::vector<ConversionOutcome>& outcomes() const { return m_outcomes; }
    std::size_t size() const { return m_outcomes.size(); }
    bool empty() const { return m_outcomes.empty(); }
    const ConversionOutcome& operator[](std::size_t index) const { return m_outcomes[index]; }

    std::vector<ConversionOutcome>::const_iterator begin() const { return m_outcomes.begin(); }
    std::vector<ConversionOutcome>::const_iterator end() const { return m_outcomes.end(); }

    std::size_t succeeded() const;
    std::size_t failed() const;

    /**
     * @brief One-line summary, e.g. "Converted 2 of 3 image(s), 1 failed."
     */
    std::string summary() const;

private:
    std::vector<ConversionOutcome> m_outcomes;
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_CONVERSION_TYPES_H
