#ifndef IMAGE_CONVERTER_DEFINITIONS_H
#define IMAGE_CONVERTER_DEFINITIONS_H

#include <string>

namespace ImageConverter {
namespace Definitions {

// --- Application identity (QCoreApplication / QStandardPaths) ---
const std::string APP_NAME = "image-converter";
const std::string APP_DISPLAY_NAME = "Image Format Converter";
const std::string ORG_NAME = "ImageConverter";

// --- Files ---
// Relative to QStandardPaths::AppConfigLocation
const std::string SETTINGS_FILE = "settings.json";
// Relative to QStandardPaths::AppLocalDataLocation
const std::string LOG_DIR = "logs";

// --- Defaults ---
const std::string DEFAULT_OUTPUT_FORMAT = "png";
const std::string DEFAULT_THEME = "dark";
constexpr int DEFAULT_JPEG_QUALITY = 95;
constexpr int DEFAULT_PNG_COMPRESSION = 3;
constexpr double DEFAULT_EXPOSURE = 1.0;
constexpr double DEFAULT_GAMMA = 2.2;
const std::string DEFAULT_BACKGROUND_COLOR = "#ffffff";
constexpr int DEFAULT_WINDOW_WIDTH = 600;
constexpr int DEFAULT_WINDOW_HEIGHT = 400;

// --- Process exit codes ---
constexpr int EXIT_ALL_CONVERTED = 0;
constexpr int EXIT_SOME_FAILED = 1;
constexpr int EXIT_USAGE_ERROR = 2;

} // namespace Definitions
} // namespace ImageConverter

#endif // IMAGE_CONVERTER_DEFINITIONS_H
