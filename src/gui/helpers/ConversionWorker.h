#pragma once

#include <QMetaType>
#include <QThread>

#include "core/ConversionTypes.h"

Q_DECLARE_METATYPE(ImageConverter::BatchReport)

/**
 * @brief Runs one conversion batch off the GUI thread.
 *
 * Emits fileConverted() after every file and exactly one of batchFinished()
 * or batchFailed() at the end. There is no cancellation: once started, the
 * batch runs to completion.
 */
class ConversionWorker : public QThread
{
    Q_OBJECT

public:
    explicit ConversionWorker(const ImageConverter::ConversionRequest& request, QObject* parent = nullptr);

signals:
    void fileConverted(int completed, int total, const QString& source, bool ok, const QString& detail);
    void batchFinished(const ImageConverter::BatchReport& report);
    void batchFailed(const QString& message);

protected:
    void run() override;

private:
    ImageConverter::ConversionRequest m_request;
};
