#include "LogWindow.h"
#include "styles/Style.h"
#include "utils/Logging.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QTextEdit>
#include <QPushButton>
#include <QLabel>
#include <QPointer>
#include <QCloseEvent>

namespace logging = ImageConverter::Logging;

LogWindow::LogWindow(QWidget *parent)
    : QWidget(parent, Qt::Window) // Qt::Window flag makes it a separate window
{
    setWindowTitle("Conversion Log");
    setGeometry(100, 100, 700, 500);

    QVBoxLayout *main_layout = new QVBoxLayout(this);

    m_logOutput = new QTextEdit;
    m_logOutput->setReadOnly(true);
    m_logOutput->setStyleSheet(Style::logViewStyle());
    main_layout->addWidget(m_logOutput);

    QHBoxLayout *footer = new QHBoxLayout;
    const QString file = logging::currentLogFile();
    QLabel *file_label = new QLabel(file.isEmpty() ? QString("Not writing a log file")
                                                   : QString("Log file: %1").arg(file));
    file_label->setTextInteractionFlags(Qt::TextSelectableByMouse);
    footer->addWidget(file_label, 1);

    m_clearButton = new QPushButton("Clear");
    connect(m_clearButton, &QPushButton::clicked, this, &LogWindow::clearLog);
    footer->addWidget(m_clearButton);
    main_layout->addLayout(footer);
}

LogWindow::~LogWindow()
{
    if (m_attached) {
        logging::setSink(logging::Sink());
    }
}

void LogWindow::attachToLog()
{
    // Records arrive on the logging thread; hop to the GUI thread
    QPointer<LogWindow> self(this);
    logging::setSink([self](QtMsgType type, const QString& line) {
        if (!self) return;
        QMetaObject::invokeMethod(self.data(), "appendLog", Qt::QueuedConnection,
                                  Q_ARG(int, static_cast<int>(type)),
                                  Q_ARG(QString, line));
    });
    m_attached = true;
}

void LogWindow::appendLog(int level, const QString &text)
{
    QString color;
    switch (static_cast<QtMsgType>(level)) {
    case QtWarningMsg:  color = "#f1c40f"; break;
    case QtCriticalMsg:
    case QtFatalMsg:    color = Style::FAILURE_COLOR.name(); break;
    case QtDebugMsg:    color = "#7f8c8d"; break;
    default:            break;
    }

    if (color.isEmpty()) {
        m_logOutput->append(text.toHtmlEscaped());
    } else {
        m_logOutput->append(QString("<span style=\"color:%1\">%2</span>").arg(color, text.toHtmlEscaped()));
    }
}

void LogWindow::clearLog()
{
    m_logOutput->clear();
}

void LogWindow::closeEvent(QCloseEvent *event)
{
    // Instead of closing, just hide the window
    this->hide();
    event->ignore();
}
