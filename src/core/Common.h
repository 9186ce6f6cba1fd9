#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for the Image Converter.
 */
namespace ImageConverter
{
    /**
     * @brief Base exception for all converter errors.
     */
    class ImageConverterException : public std::runtime_error {
    public:
        explicit ImageConverterException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief A request that cannot be started at all: unknown target format,
     * empty source list, or a destination directory that is missing or not writable.
     * Thrown before any conversion work begins.
     */
    class ValidationError : public ImageConverterException {
    public:
        explicit ValidationError(const std::string& message)
            : ImageConverterException(message) {}
    };

    /**
     * @brief The codec failed for a single file. The message is the reason
     * recorded in that file's outcome.
     */
    class ConversionError : public ImageConverterException {
    public:
        explicit ConversionError(const std::string& message)
            : ImageConverterException(message) {}
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return data;
    }

} // namespace ImageConverter
