#include "MainWindow.h"

#include "tabs/ConvertTab.h"
#include "windows/LogWindow.h"
#include "styles/Style.h"
#include "utils/Definitions.h"
#include "utils/Logging.h"

// Qt Includes
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QComboBox>
#include <QTabWidget>
#include <QMessageBox>
#include <QStyle>
#include <QApplication>
#include <QKeyEvent>
#include <QCloseEvent>

namespace def = ImageConverter::Definitions;

MainWindow::MainWindow(ImageConverter::AppSettings& settings, QWidget* parent)
    : QWidget(parent),
      m_settings(settings),
      m_current_theme(QString::fromStdString(def::DEFAULT_THEME)),
      m_convert_tab(nullptr),
      m_log_window(nullptr)
{
    setWindowTitle(QString::fromStdString(def::APP_DISPLAY_NAME));
    setMinimumSize(def::DEFAULT_WINDOW_WIDTH, def::DEFAULT_WINDOW_HEIGHT);
    resize(m_settings.windowSize().expandedTo(minimumSize()));

    // Created up front so records logged before it is first shown are kept
    m_log_window = new LogWindow(this);
    m_log_window->attachToLog();

    init_ui();

    // Apply theme after all widgets are initialized
    const QString saved = m_settings.theme();
    set_application_theme(Style::isKnownTheme(saved) ? saved : m_current_theme);
}

MainWindow::~MainWindow()
{
    // Qt's parent-child system deletes the tab and the log window
}

void MainWindow::init_ui()
{
    QVBoxLayout* vbox = new QVBoxLayout(this);
    vbox->setContentsMargins(0, 0, 0, 0);

    // --- Application Header ---
    m_header_widget = new QWidget;
    m_header_widget->setObjectName("header_widget");
    QHBoxLayout* header_layout = new QHBoxLayout(m_header_widget);
    header_layout->setContentsMargins(10, 5, 10, 5);

    m_title_label = new QLabel(QString::fromStdString(def::APP_DISPLAY_NAME));
    m_title_label->setObjectName("title_label");
    header_layout->addWidget(m_title_label);
    header_layout->addStretch(1);

    m_theme_combo = new QComboBox;
    m_theme_combo->addItem("Dark", "dark");
    m_theme_combo->addItem("Light", "light");
    m_theme_combo->setToolTip("Colour theme");
    connect(m_theme_combo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        set_application_theme(m_theme_combo->itemData(index).toString());
    });
    header_layout->addWidget(m_theme_combo);

    m_log_button = new QPushButton("Show Log");
    m_log_button->setIcon(style()->standardIcon(QStyle::SP_FileDialogDetailedView));
    m_log_button->setToolTip("Open the conversion log");
    connect(m_log_button, &QPushButton::clicked, this, &MainWindow::open_log_window);
    header_layout->addWidget(m_log_button);

    vbox->addWidget(m_header_widget);

    // --- Tabs container ---
    m_tabs = new QTabWidget;
    m_convert_tab = new ConvertTab(m_settings, this);
    m_tabs->addTab(m_convert_tab, "Convert Format");
    vbox->addWidget(m_tabs);
}

void MainWindow::set_application_theme(const QString& theme_name)
{
    if (!Style::isKnownTheme(theme_name)) {
        qCWarning(lcUi) << "Unknown theme" << theme_name;
        return;
    }

    m_current_theme = theme_name;
    m_settings.setTheme(theme_name);
    qApp->setStyleSheet(Style::themeStyleSheet(theme_name));

    const int index = m_theme_combo->findData(theme_name);
    if (index >= 0 && index != m_theme_combo->currentIndex()) {
        QSignalBlocker blocker(m_theme_combo);
        m_theme_combo->setCurrentIndex(index);
    }

    const Style::Palette palette = (theme_name == "light") ? Style::lightPalette() : Style::darkPalette();
    m_header_widget->setStyleSheet(QString(
        "QWidget#header_widget { background-color: %1; padding: 10px; border-bottom: 2px solid %2; }"
    ).arg(palette.headerBackground, palette.accent));

    update_header();
}

void MainWindow::update_header()
{
    const Style::Palette palette = (m_current_theme == "light") ? Style::lightPalette() : Style::darkPalette();
    m_title_label->setStyleSheet(QString(
        "color: %1; font-size: 18pt; font-weight: bold;"
    ).arg(palette.headerText));
}

void MainWindow::open_log_window()
{
    m_log_window->show();
    m_log_window->raise();
    m_log_window->activateWindow();
}

void MainWindow::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape) {
        close();
    } else {
        QWidget::keyPressEvent(event);
    }
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_convert_tab->is_busy()) {
        const auto answer = QMessageBox::question(
            this, "Conversion Running",
            "A conversion is still running and cannot be interrupted.\n"
            "Wait for it to finish and then quit?");
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
    }

    m_convert_tab->store_settings();
    m_settings.setWindowSize(size());
    if (!m_settings.save()) {
        qCWarning(lcUi) << "Settings were not saved to" << m_settings.filePath();
    }

    m_log_window->hide();
    QWidget::closeEvent(event);
}
