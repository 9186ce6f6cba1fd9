#pragma once

#include <QString>
#include <QColor>

class QWidget;

/**
 * @brief Themes, stylesheets and style helpers shared by the converter widgets.
 */
namespace Style {

    /**
     * @brief Creates and applies a QGraphicsDropShadowEffect to a given widget.
     */
    void applyShadowEffect(QWidget* widget,
                           const QColor& color = QColor("#000000"),
                           int radius = 10,
                           int x_offset = 0,
                           int y_offset = 4);

    /**
     * @brief Colours a theme is built from.
     */
    struct Palette {
        QString accent;
        QString accentHover;
        QString accentPressed;
        QString background;
        QString secondaryBackground;
        QString text;
        QString mutedText;
        QString border;
        QString headerBackground;
        QString headerText;
    };

    Palette darkPalette();
    Palette lightPalette();

    /**
     * @brief Returns true for "dark" and "light".
     */
    bool isKnownTheme(const QString& theme);

    /**
     * @brief Application-wide stylesheet for the given theme.
     * Unknown theme names fall back to the dark theme.
     */
    QString themeStyleSheet(const QString& theme);

    // --- Special Widget Styles ---
    QString runButtonStyle();
    QString logViewStyle();

    // Foreground colours of the per-file result rows
    extern const QColor SUCCESS_COLOR;
    extern const QColor FAILURE_COLOR;

} // namespace Style
