#include "ConversionWorker.h"
#include "core/BatchConverter.h"
#include "core/OpenCvCodec.h"
#include "utils/Logging.h"

using namespace ImageConverter;

ConversionWorker::ConversionWorker(const ConversionRequest& request, QObject* parent)
    : QThread(parent), m_request(request)
{
    qRegisterMetaType<ImageConverter::BatchReport>();
}

void ConversionWorker::run()
{
    OpenCvCodec codec;
    BatchConverter converter(codec);

    try {
        BatchReport report = converter.convertBatch(m_request,
            [this](std::size_t completed, std::size_t total, const ConversionOutcome& outcome) {
                const QString detail = outcome.ok()
                    ? QString::fromStdString(outcome.destination.filename().string())
                    : QString::fromStdString(outcome.reason);
                emit fileConverted(static_cast<int>(completed), static_cast<int>(total),
                                   QString::fromStdString(outcome.source.string()),
                                   outcome.ok(), detail);
            });
        emit batchFinished(report);

    } catch (const ValidationError& e) {
        emit batchFailed(QString::fromStdString(e.what()));
    } catch (const std::exception& e) {
        qCCritical(lcBatch) << "Batch aborted:" << e.what();
        emit batchFailed(QString("Conversion stopped unexpectedly: %1").arg(e.what()));
    }
}
