#include <QApplication>
#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>

#include <iostream>
#include <memory>

#include "core/OpenCvCodec.h"
#include "gui/MainWindow.h"
#include "utils/AppSettings.h"
#include "utils/ArgParser.h"
#include "utils/CliRequestSource.h"
#include "utils/CliRunner.h"
#include "utils/Definitions.h"
#include "utils/Logging.h"

using namespace ImageConverter;
namespace def = Definitions;

namespace {

QString logDirectory()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        base = QDir::currentPath();
    }
    return QDir(base).filePath(QString::fromStdString(def::LOG_DIR));
}

QString settingsPath(ArgParser::Arguments& args)
{
    const std::string config = args.stringArgs["config"];
    return config.empty() ? AppSettings::defaultFilePath() : QString::fromStdString(config);
}

int runConvert(ArgParser::Arguments& args, const AppSettings& settings)
{
    CliRequestSource source(args, settings.encodeOptions());
    OpenCvCodec codec;
    CliRunner runner(codec, std::cout, std::cerr);
    return runner.run(source);
}

int runGui(ArgParser::Arguments& args, AppSettings& settings)
{
    const std::string theme = args.stringArgs["theme"];
    if (!theme.empty()) {
        settings.setTheme(QString::fromStdString(theme));
    }

    MainWindow window(settings);
    window.show();
    return qApp->exec();
}

} // namespace

int main(int argc, char* argv[])
{
    // OpenCV ships its EXR codec switched off at runtime
    if (!qEnvironmentVariableIsSet("OPENCV_IO_ENABLE_OPENEXR")) {
        qputenv("OPENCV_IO_ENABLE_OPENEXR", "1");
    }

    QCoreApplication::setOrganizationName(QString::fromStdString(def::ORG_NAME));
    QCoreApplication::setApplicationName(QString::fromStdString(def::APP_NAME));

    ArgParser parser;
    ArgParser::Arguments args;
    try {
        args = parser.parseArgs(argc, argv);
    } catch (const ArgParser::HelpRequested&) {
        return def::EXIT_ALL_CONVERTED;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return def::EXIT_USAGE_ERROR;
    }

    // The GUI needs a QApplication; the headless command only the core one
    std::unique_ptr<QCoreApplication> app;
    if (args.command == "gui") {
        app = std::make_unique<QApplication>(argc, argv);
        QApplication::setApplicationDisplayName(QString::fromStdString(def::APP_DISPLAY_NAME));
    } else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    if (!Logging::install(logDirectory())) {
        std::cerr << "Warning: logging to the console only." << std::endl;
    }
    qCInfo(lcConfig) << "Starting" << QString::fromStdString(def::APP_NAME)
                     << "command:" << QString::fromStdString(args.command);

    AppSettings settings(settingsPath(args));
    if (!settings.load()) {
        qCWarning(lcConfig) << "Continuing with default settings";
    }

    int rc = def::EXIT_ALL_CONVERTED;
    if (args.command == "convert") {
        rc = runConvert(args, settings);
    } else {
        rc = runGui(args, settings);
    }

    qCInfo(lcConfig) << "Exiting with code" << rc;
    Logging::uninstall();
    return rc;
}
