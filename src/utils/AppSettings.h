#pragma once

#include <QJsonObject>
#include <QSize>
#include <QString>

#include "core/ConversionTypes.h"

namespace ImageConverter {

/**
 * @brief User preferences persisted as a JSON file.
 *
 * Holds the "last used" directories and format, encoder defaults, theme and
 * window size. Owned by main() and handed to the widgets that need it; there
 * is no global instance.
 */
class AppSettings
{
public:
    explicit AppSettings(const QString& filePath = defaultFilePath());

    /**
     * @brief <AppConfigLocation>/settings.json
     */
    static QString defaultFilePath();

    /**
     * @brief The built-in values used for missing keys.
     */
    static QJsonObject defaults();

    /**
     * @brief Reads the file and merges it over the defaults.
     * A missing file is not an error. A malformed file leaves the defaults in place.
     * @return false if the file exists but could not be read or parsed.
     */
    bool load();

    /**
     * @brief Writes the current values, creating the parent directory if needed.
     */
    bool save() const;

    /**
     * @brief Restores the defaults (does not save).
     */
    void reset();

    QString filePath() const { return m_filePath; }
    QJsonObject toJson() const { return m_values; }

    QString lastInputDirectory() const;
    void setLastInputDirectory(const QString& dir);

    QString lastOutputDirectory() const;
    void setLastOutputDirectory(const QString& dir);

    QString lastOutputFormat() const;
    void setLastOutputFormat(const QString& format);

    int jpegQuality() const;
    void setJpegQuality(int quality);

    int pngCompression() const;
    void setPngCompression(int level);

    // Tone mapping for float sources
    double exposure() const;
    void setExposure(double exposure);

    double gamma() const;
    void setGamma(double gamma);

    /**
     * @brief Fill behind transparent pixels, "#rrggbb". Unparsable values read as white.
     */
    RgbColor backgroundColor() const;
    void setBackgroundColor(const RgbColor& color);

    /**
     * @brief Encoder options built from the saved values. The JPEG quality
     * doubles as the WebP quality.
     */
    EncodeOptions encodeOptions() const;

    QString theme() const;
    void setTheme(const QString& theme);

    QSize windowSize() const;
    void setWindowSize(const QSize& size);

private:
    QString m_filePath;
    QJsonObject m_values;
};

} // namespace ImageConverter
