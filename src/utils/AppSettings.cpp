#include "AppSettings.h"
#include "Definitions.h"
#include "Logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>
#include <algorithm>

namespace ImageConverter {

namespace def = Definitions;

namespace {

const QString KEY_LAST_INPUT_DIR = QStringLiteral("last_input_directory");
const QString KEY_LAST_OUTPUT_DIR = QStringLiteral("last_output_directory");
const QString KEY_LAST_OUTPUT_FORMAT = QStringLiteral("last_output_format");
const QString KEY_JPEG_QUALITY = QStringLiteral("jpeg_quality");
const QString KEY_PNG_COMPRESSION = QStringLiteral("png_compression");
const QString KEY_EXPOSURE = QStringLiteral("exposure");
const QString KEY_GAMMA = QStringLiteral("gamma");
const QString KEY_BACKGROUND_COLOR = QStringLiteral("background_color");
const QString KEY_THEME = QStringLiteral("theme");
const QString KEY_WINDOW_SIZE = QStringLiteral("window_size");

constexpr double MIN_EXPOSURE = 0.01;
constexpr double MAX_EXPOSURE = 100.0;
constexpr double MIN_GAMMA = 0.1;
constexpr double MAX_GAMMA = 10.0;

} // namespace

AppSettings::AppSettings(const QString& filePath)
    : m_filePath(filePath), m_values(defaults())
{
}

QString AppSettings::defaultFilePath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty()) {
        dir = QDir::current().filePath("config");
    }
    return QDir(dir).filePath(QString::fromStdString(def::SETTINGS_FILE));
}

QJsonObject AppSettings::defaults()
{
    QJsonObject windowSize;
    windowSize["width"] = def::DEFAULT_WINDOW_WIDTH;
    windowSize["height"] = def::DEFAULT_WINDOW_HEIGHT;

    QJsonObject values;
    values[KEY_LAST_INPUT_DIR] = "";
    values[KEY_LAST_OUTPUT_DIR] = "";
    values[KEY_LAST_OUTPUT_FORMAT] = QString::fromStdString(def::DEFAULT_OUTPUT_FORMAT);
    values[KEY_JPEG_QUALITY] = def::DEFAULT_JPEG_QUALITY;
    values[KEY_PNG_COMPRESSION] = def::DEFAULT_PNG_COMPRESSION;
    values[KEY_EXPOSURE] = def::DEFAULT_EXPOSURE;
    values[KEY_GAMMA] = def::DEFAULT_GAMMA;
    values[KEY_BACKGROUND_COLOR] = QString::fromStdString(def::DEFAULT_BACKGROUND_COLOR);
    values[KEY_THEME] = QString::fromStdString(def::DEFAULT_THEME);
    values[KEY_WINDOW_SIZE] = windowSize;
    return values;
}

bool AppSettings::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcConfig) << "No settings file at" << m_filePath << "- using defaults";
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcConfig) << "Could not open settings file" << m_filePath << ":" << file.errorString();
        return false;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcConfig) << "Ignoring malformed settings file" << m_filePath << ":" << error.errorString();
        return false;
    }

    QJsonObject merged = defaults();
    const QJsonObject saved = doc.object();
    for (auto it = saved.begin(); it != saved.end(); ++it) {
        // Only keys we know, with the type the defaults have
        if (merged.contains(it.key()) && merged.value(it.key()).type() == it.value().type()) {
            merged[it.key()] = it.value();
        }
    }
    m_values = merged;
    qCInfo(lcConfig) << "Loaded settings from" << m_filePath;
    return true;
}

bool AppSettings::save() const
{
    QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        qCWarning(lcConfig) << "Could not create settings directory" << info.absolutePath();
        return false;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcConfig) << "Could not write settings file" << m_filePath << ":" << file.errorString();
        return false;
    }
    if (file.write(QJsonDocument(m_values).toJson(QJsonDocument::Indented)) < 0) {
        qCWarning(lcConfig) << "Could not write settings file" << m_filePath << ":" << file.errorString();
        return false;
    }
    qCDebug(lcConfig) << "Saved settings to" << m_filePath;
    return true;
}

void AppSettings::reset()
{
    m_values = defaults();
}

QString AppSettings::lastInputDirectory() const { return m_values.value(KEY_LAST_INPUT_DIR).toString(); }
void AppSettings::setLastInputDirectory(const QString& dir) { m_values[KEY_LAST_INPUT_DIR] = dir; }

QString AppSettings::lastOutputDirectory() const { return m_values.value(KEY_LAST_OUTPUT_DIR).toString(); }
void AppSettings::setLastOutputDirectory(const QString& dir) { m_values[KEY_LAST_OUTPUT_DIR] = dir; }

QString AppSettings::lastOutputFormat() const { return m_values.value(KEY_LAST_OUTPUT_FORMAT).toString(); }
void AppSettings::setLastOutputFormat(const QString& format) { m_values[KEY_LAST_OUTPUT_FORMAT] = format; }

int AppSettings::jpegQuality() const
{
    return std::clamp(m_values.value(KEY_JPEG_QUALITY).toInt(def::DEFAULT_JPEG_QUALITY), 0, 100);
}
void AppSettings::setJpegQuality(int quality) { m_values[KEY_JPEG_QUALITY] = std::clamp(quality, 0, 100); }

int AppSettings::pngCompression() const
{
    return std::clamp(m_values.value(KEY_PNG_COMPRESSION).toInt(def::DEFAULT_PNG_COMPRESSION), 0, 9);
}
void AppSettings::setPngCompression(int level) { m_values[KEY_PNG_COMPRESSION] = std::clamp(level, 0, 9); }

double AppSettings::exposure() const
{
    return std::clamp(m_values.value(KEY_EXPOSURE).toDouble(def::DEFAULT_EXPOSURE), MIN_EXPOSURE, MAX_EXPOSURE);
}
void AppSettings::setExposure(double exposure) { m_values[KEY_EXPOSURE] = std::clamp(exposure, MIN_EXPOSURE, MAX_EXPOSURE); }

double AppSettings::gamma() const
{
    return std::clamp(m_values.value(KEY_GAMMA).toDouble(def::DEFAULT_GAMMA), MIN_GAMMA, MAX_GAMMA);
}
void AppSettings::setGamma(double gamma) { m_values[KEY_GAMMA] = std::clamp(gamma, MIN_GAMMA, MAX_GAMMA); }

RgbColor AppSettings::backgroundColor() const
{
    const std::string text = m_values.value(KEY_BACKGROUND_COLOR).toString().toStdString();
    return RgbColor::fromString(text).value_or(RgbColor());
}
void AppSettings::setBackgroundColor(const RgbColor& color)
{
    m_values[KEY_BACKGROUND_COLOR] = QString::fromStdString(color.toHex());
}

EncodeOptions AppSettings::encodeOptions() const
{
    EncodeOptions options;
    options.jpegQuality = jpegQuality();
    options.webpQuality = jpegQuality();
    options.pngCompression = pngCompression();
    options.exposure = exposure();
    options.gamma = gamma();
    options.background = backgroundColor();
    return options;
}

QString AppSettings::theme() const { return m_values.value(KEY_THEME).toString(); }
void AppSettings::setTheme(const QString& theme) { m_values[KEY_THEME] = theme; }

QSize AppSettings::windowSize() const
{
    const QJsonObject size = m_values.value(KEY_WINDOW_SIZE).toObject();
    return QSize(size.value("width").toInt(def::DEFAULT_WINDOW_WIDTH),
                 size.value("height").toInt(def::DEFAULT_WINDOW_HEIGHT));
}

void AppSettings::setWindowSize(const QSize& size)
{
    QJsonObject obj;
    obj["width"] = size.width();
    obj["height"] = size.height();
    m_values[KEY_WINDOW_SIZE] = obj;
}

} // namespace ImageConverter
