#include "CliRunner.h"
#include "Definitions.h"
#include "core/BatchConverter.h"

namespace ImageConverter {

namespace def = Definitions;

CliRunner::CliRunner(ImageCodec& codec, std::ostream& out, std::ostream& err)
    : m_codec(codec), m_out(out), m_err(err)
{
}

int CliRunner::run(RequestSource& source)
{
    auto request = source.nextRequest();
    if (!request) {
        m_err << "Error: no image files found in the given inputs." << std::endl;
        return def::EXIT_USAGE_ERROR;
    }

    BatchConverter converter(m_codec);

    try {
        BatchReport report = converter.convertBatch(*request,
            [this](std::size_t completed, std::size_t total, const ConversionOutcome& outcome) {
                m_out << "[" << completed << "/" << total << "] ";
                if (outcome.ok()) {
                    m_out << "OK   " << outcome.source.string() << " -> " << outcome.destination.string();
                } else {
                    m_out << "FAIL " << outcome.source.string() << ": " << outcome.reason;
                }
                m_out << std::endl;
            });

        m_out << report.summary() << std::endl;
        return report.failed() == 0 ? def::EXIT_ALL_CONVERTED : def::EXIT_SOME_FAILED;

    } catch (const ValidationError& e) {
        m_err << "Error: " << e.what() << std::endl;
        return def::EXIT_USAGE_ERROR;
    }
}

} // namespace ImageConverter
