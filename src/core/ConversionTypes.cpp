#include "ConversionTypes.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <utility>

namespace ImageConverter {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

std::optional<RgbColor> RgbColor::fromString(const std::string& text) {
    if (text.find(',') != std::string::npos) {
        std::istringstream ss(text);
        std::string part;
        std::vector<int> components;
        while (std::getline(ss, part, ',')) {
            if (part.empty() || part.size() > 3 ||
                !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
            const int value = std::stoi(part);
            if (value > 255) return std::nullopt;
            components.push_back(value);
        }
        if (components.size() != 3 || text.back() == ',') return std::nullopt;
        return RgbColor{components[0], components[1], components[2]};
    }

    std::string hex = text;
    if (!hex.empty() && hex.front() == '#') {
        hex.erase(0, 1);
    }
    if (hex.size() != 6) return std::nullopt;

    int values[3];
    for (int i = 0; i < 3; ++i) {
        const int high = hexDigit(hex[2 * i]);
        const int low = hexDigit(hex[2 * i + 1]);
        if (high < 0 || low < 0) return std::nullopt;
        values[i] = high * 16 + low;
    }
    return RgbColor{values[0], values[1], values[2]};
}

std::string RgbColor::toHex() const {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x",
                  std::clamp(red, 0, 255), std::clamp(green, 0, 255), std::clamp(blue, 0, 255));
    return buffer;
}

ConversionOutcome ConversionOutcome::success(const fs::path& source, const fs::path& destination) {
    ConversionOutcome outcome;
    outcome.source = source;
    outcome.destination = destination;
    outcome.status = Status::Success;
    return outcome;
}

ConversionOutcome ConversionOutcome::failure(const fs::path& source, const fs::path& destination, const std::string& reason) {
    ConversionOutcome outcome;
    outcome.source = source;
    outcome.destination = destination;
    outcome.status = Status::Failed;
    outcome.reason = reason;
    return outcome;
}

BatchReport::BatchReport(std::vector<ConversionOutcome> outcomes)
    : m_outcomes(std::move(outcomes))
{
}

std::size_t BatchReport::succeeded() const {
    return static_cast<std::size_t>(std::count_if(m_outcomes.begin(), m_outcomes.end(),
        [](const ConversionOutcome& o) { return o.ok(); }));
}

std::size_t BatchReport::failed() const {
    return m_outcomes.size() - succeeded();
}

std::string BatchReport::summary() const {
    std::ostringstream ss;
    ss << "Converted " << succeeded() << " of " << size() << " image(s)";
    if (failed() > 0) {
        ss << ", " << failed() << " failed";
    }
    ss << ".";
    return ss.str();
}

} // namespace ImageConverter
