#pragma once

#include <QWidget>
#include <QCloseEvent>

class QTextEdit;
class QPushButton;

/**
 * @brief A separate window showing the application log as it is written.
 * Hides on close instead of deleting.
 */
class LogWindow : public QWidget
{
    Q_OBJECT

public:
    explicit LogWindow(QWidget* parent = nullptr);
    ~LogWindow() override;

    /**
     * @brief Routes every log record to this window. Safe to call from any thread.
     */
    void attachToLog();

public slots:
    void appendLog(int level, const QString& text);
    void clearLog();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    QTextEdit* m_logOutput;
    QPushButton* m_clearButton;
    bool m_attached = false;
};
