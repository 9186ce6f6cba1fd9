#pragma once

#include <QWidget>

#include "utils/AppSettings.h"

// Forward declarations
class QTabWidget;
class QPushButton;
class QComboBox;
class QLabel;
class QKeyEvent;
class QCloseEvent;
class ConvertTab;
class LogWindow;

class MainWindow : public QWidget
{
    Q_OBJECT

public:
    /**
     * @param settings Shared preferences; must outlive the window.
     */
    explicit MainWindow(ImageConverter::AppSettings& settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    QString current_theme() const { return m_current_theme; }
    ConvertTab* convert_tab() const { return m_convert_tab; }

public slots:
    void set_application_theme(const QString& theme_name);
    void update_header();
    void open_log_window();

protected:
    void keyPressEvent(QKeyEvent *event) override;
    void closeEvent(QCloseEvent *event) override;

private:
    void init_ui();

    ImageConverter::AppSettings& m_settings;
    QString m_current_theme;

    ConvertTab* m_convert_tab;
    LogWindow* m_log_window;

    // UI Widgets
    QWidget* m_header_widget;
    QLabel* m_title_label;
    QComboBox* m_theme_combo;
    QPushButton* m_log_button;
    QTabWidget* m_tabs;
};
