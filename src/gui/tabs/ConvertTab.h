#ifndef CONVERT_TAB_H
#define CONVERT_TAB_H

#include <QStringList>
#include <QWidget>

#include "BaseTab.h"
#include "core/ConversionTypes.h"
#include "core/RequestSource.h"
#include "helpers/ConversionWorker.h"

// Forward declarations for Qt classes
class QComboBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QDoubleSpinBox;
class QCheckBox;

/**
 * @brief The Convert Format tab: pick source files, a target format and a
 * destination directory, then run the batch on a ConversionWorker.
 */
class ConvertTab : public BaseTab, public ImageConverter::RequestSource
{
    Q_OBJECT

public:
    explicit ConvertTab(ImageConverter::AppSettings& settings, QWidget *parent = nullptr);
    ~ConvertTab() override;

    // --- BaseTab ---
    void browse_input() override;
    void browse_output() override;
    void store_settings() override;
    bool is_busy() const override;

    /**
     * @brief The batch described by the form, or std::nullopt if no file is selected.
     * Validation of format and destination is left to BatchConverter.
     */
    std::optional<ImageConverter::ConversionRequest> nextRequest() override;

    /**
     * @brief Appends files to the source list, skipping ones already listed.
     * @return Number of files actually added.
     */
    int addSourceFiles(const QStringList& files);
    QStringList sourceFiles() const;

signals:
    void conversionStarted(int total);
    void conversionFinished(int succeeded, int failed);

public slots:
    void startConversion();

private slots:
    void browseDirectoryInput();
    void removeSelectedSources();
    void clearSources();
    void updateSelectionInfo();
    void updateEncoderOptions();
    void chooseBackground();

    // Worker result slots
    void onFileConverted(int completed, int total, const QString& source, bool ok, const QString& detail);
    void onConversionDone(const ImageConverter::BatchReport& report);
    void onConversionError(const QString& msg);

private:
    void setupUi();
    void setRunning(bool running);
    void showBackground();

    ConversionWorker *m_worker;

    // --- UI Elements ---
    // Sources Group
    QListWidget *m_sourceList;
    QCheckBox *m_recursiveCheckbox;
    QLabel *m_infoLabel;
    QPushButton *m_btnAddFiles;
    QPushButton *m_btnAddDir;
    QPushButton *m_btnRemove;
    QPushButton *m_btnClear;

    // Settings Group
    QComboBox *m_outputFormat;
    QLineEdit *m_outputPath;
    QPushButton *m_btnOutput;
    QSpinBox *m_jpegQuality;
    QSpinBox *m_pngCompression;
    QDoubleSpinBox *m_exposure;
    QDoubleSpinBox *m_gamma;
    QPushButton *m_btnBackground;
    ImageConverter::RgbColor m_background;

    // Run & Results
    QPushButton *m_runButton;
    QProgressBar *m_progress;
    QLabel *m_statusLabel;
    QListWidget *m_resultList;
};

#endif // CONVERT_TAB_H
