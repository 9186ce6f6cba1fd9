#include "Style.h"
#include <QWidget>
#include <QGraphicsDropShadowEffect>

namespace Style {

void applyShadowEffect(QWidget* widget, const QColor& color, int radius, int x_offset, int y_offset)
{
    QGraphicsDropShadowEffect* shadow = new QGraphicsDropShadowEffect(widget);
    shadow->setColor(color);
    shadow->setBlurRadius(radius);
    shadow->setOffset(x_offset, y_offset);
    widget->setGraphicsEffect(shadow);
}

const QColor SUCCESS_COLOR("#2ecc71");
const QColor FAILURE_COLOR("#e74c3c");

Palette darkPalette()
{
    Palette p;
    p.accent = "#00bcd4";
    p.accentHover = "#0097a7";
    p.accentPressed = "#00838f";
    p.background = "#1e1e1e";
    p.secondaryBackground = "#2d2d30";
    p.text = "#cccccc";
    p.mutedText = "#888888";
    p.border = "#3e3e3e";
    p.headerBackground = "#2d2d30";
    p.headerText = "white";
    return p;
}

Palette lightPalette()
{
    Palette p;
    p.accent = "#007AFF";
    p.accentHover = "#0056b3";
    p.accentPressed = "#004085";
    p.background = "#f5f5f5";
    p.secondaryBackground = "#ffffff";
    p.text = "#1e1e1e";
    p.mutedText = "#555555";
    p.border = "#cccccc";
    p.headerBackground = "#ffffff";
    p.headerText = "#1e1e1e";
    return p;
}

bool isKnownTheme(const QString& theme)
{
    return theme == "dark" || theme == "light";
}

QString themeStyleSheet(const QString& theme)
{
    const Palette p = (theme == "light") ? lightPalette() : darkPalette();

    // %1 bg, %2 text, %3 accent, %4 hover, %5 pressed, %6 muted text,
    // %7 border, %8 secondary bg, %9 header bg
    return QString(R"(
    QWidget, QDialog {
        background-color: %1;
        color: %2;
        font-family: 'Segoe UI', 'Arial', sans-serif;
        font-size: 10pt;
    }
    QPushButton {
        background: qlineargradient(x1: 0, y1: 0, x2: 0, y2: 1, stop: 0 %3, stop: 1 %4);
        color: white;
        border: none;
        padding: 8px 16px;
        border-radius: 6px;
        font-weight: 600;
    }
    QPushButton:hover { background: %3; }
    QPushButton:pressed { background: %5; padding-top: 10px; padding-bottom: 6px; }
    QPushButton:disabled { background-color: %7; color: %6; }
    QTabWidget::pane { border: 1px solid %7; background-color: %1; border-radius: 8px; }
    QTabBar::tab {
        background: %8; color: %6; padding: 10px 20px;
        border: none; border-top-left-radius: 6px; border-top-right-radius: 6px;
        margin-right: 2px;
    }
    QTabBar::tab:selected { background: %1; color: %3; border-bottom: 2px solid %3; font-weight: bold; }
    QLineEdit, QComboBox, QSpinBox, QListWidget {
        background-color: %8; color: %2; border: 1px solid %7;
        padding: 6px; border-radius: 4px;
        selection-background-color: %3; selection-color: white;
    }
    QLineEdit:focus, QComboBox:focus, QSpinBox:focus, QListWidget:focus { border: 1px solid %3; }
    QProgressBar {
        border: 1px solid %7; border-radius: 4px; background-color: %8;
        text-align: center; color: %2; min-height: 18px;
    }
    QProgressBar::chunk { background-color: %3; border-radius: 3px; }
    QGroupBox { border: 1px solid %7; margin-top: 25px; border-radius: 8px; padding-top: 15px; }
    QGroupBox::title {
        subcontrol-origin: margin; subcontrol-position: top center;
        padding: 0 12px; background-color: %3; color: white;
        font-size: 11pt; border-radius: 4px;
    }
    QLabel { color: %2; background-color: transparent; }
    QWidget#header_widget { background-color: %9; border-bottom: 2px solid %3; }
)")
        .arg(p.background)           // %1
        .arg(p.text)                 // %2
        .arg(p.accent)               // %3
        .arg(p.accentHover)          // %4
        .arg(p.accentPressed)        // %5
        .arg(p.mutedText)            // %6
        .arg(p.border)               // %7
        .arg(p.secondaryBackground)  // %8
        .arg(p.headerBackground);    // %9
}

QString runButtonStyle()
{
    return QStringLiteral(R"(
        QPushButton {
            background: qlineargradient(x1:0, y1:0, x2:0, y2:1,
                stop:0 #667eea, stop:1 #764ba2);
            color: white; font-weight: bold; font-size: 14pt;
            padding: 12px; border-radius: 8px; min-height: 36px;
        }
        QPushButton:hover { background: qlineargradient(x1:0, y1:0, x2:0, y2:1,
            stop:0 #764ba2, stop:1 #667eea); }
        QPushButton:disabled { background: #4f545c; color: #a0a0a0; }
        QPushButton:pressed { background: #5a67d8; }
    )");
}

QString logViewStyle()
{
    return QStringLiteral("background:#1e1e1e; color:#b9bbbe; border:none; font-family: monospace;");
}

} // namespace Style
