#pragma once

#include <QLoggingCategory>
#include <QString>
#include <functional>

Q_DECLARE_LOGGING_CATEGORY(lcBatch)
Q_DECLARE_LOGGING_CATEGORY(lcCodec)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

namespace ImageConverter {
namespace Logging {

    using Sink = std::function<void(QtMsgType, const QString&)>;

    /**
     * @brief Installs the application message handler.
     *
     * Every record is appended to <logDir>/converter_yyyyMMdd.log; records of
     * level info and above are echoed to stderr. An empty logDir disables the
     * file output.
     * @return false if the log file could not be opened (console output still works).
     */
    bool install(const QString& logDir);

    /**
     * @brief Restores Qt's default handler and closes the log file.
     */
    void uninstall();

    /**
     * @brief Receives every formatted line, from whichever thread logged it.
     * Pass an empty function to detach.
     */
    void setSink(Sink sink);

    /**
     * @brief "yyyy-MM-dd hh:mm:ss.zzz - category - LEVEL - message"
     */
    QString formatRecord(QtMsgType type, const char* category, const QString& message);

    /**
     * @brief Path of the file currently being written, empty if none.
     */
    QString currentLogFile();

} // namespace Logging
} // namespace ImageConverter
