#pragma once

#include <QWidget>

#include "utils/AppSettings.h"

/**
 * @brief Abstract base class for the tabs of the main window.
 *
 * Every tab reads its initial state from the shared AppSettings and writes
 * back what the user chose when asked to.
 */
class BaseTab : public QWidget
{
    Q_OBJECT

public:
    explicit BaseTab(ImageConverter::AppSettings& settings, QWidget *parent = nullptr);
    ~BaseTab() override = default;

    // --- Pure Virtual Methods ---
    virtual void browse_input() = 0;
    virtual void browse_output() = 0;

    /**
     * @brief Copies the tab's current choices into the settings (does not save).
     */
    virtual void store_settings() = 0;

    /**
     * @brief Whether the tab has work running that closing would interrupt.
     */
    virtual bool is_busy() const { return false; }

protected:
    /**
     * @brief A directory to open file dialogs in: the remembered one if it
     * still exists, the user's pictures folder otherwise.
     */
    static QString start_directory(const QString& remembered);

    ImageConverter::AppSettings& m_settings;
};
