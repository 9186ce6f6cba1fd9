#include "ConvertTab.h"
#include "core/BatchConverter.h"
#include "core/FileSystemUtil.h"
#include "core/ImageFormat.h"
#include "core/ImageUtil.h"
#include "styles/Style.h"
#include "utils/Logging.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QLineEdit>
#include <QPushButton>
#include <QCheckBox>
#include <QComboBox>
#include <QSpinBox>
#include <QDoubleSpinBox>
#include <QColor>
#include <QColorDialog>
#include <QLabel>
#include <QListWidget>
#include <QProgressBar>
#include <QMessageBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QSet>

using namespace ImageConverter;

namespace {

QString imageDialogFilter()
{
    QStringList patterns;
    for (const auto& ext : ImageFormat::sourceExtensions()) {
        patterns << "*" + QString::fromStdString(ext);
    }
    return QString("Images (%1);;All Files (*)").arg(patterns.join(' '));
}

} // namespace

ConvertTab::ConvertTab(AppSettings& settings, QWidget *parent)
    : BaseTab(settings, parent), m_worker(nullptr)
{
    setupUi();
}

ConvertTab::~ConvertTab()
{
    // Conversions cannot be interrupted; let the batch finish before the worker goes away
    if (m_worker && m_worker->isRunning()) {
        qCInfo(lcUi) << "Waiting for the running conversion to finish";
        m_worker->wait();
    }
}

void ConvertTab::setupUi()
{
    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    // --- Source Images Group ---
    QGroupBox *sourceGroup = new QGroupBox("Source Images");
    QVBoxLayout *sourceLayout = new QVBoxLayout(sourceGroup);

    m_sourceList = new QListWidget();
    m_sourceList->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_sourceList->setMinimumHeight(110);
    connect(m_sourceList, &QListWidget::itemSelectionChanged, this, &ConvertTab::updateSelectionInfo);
    sourceLayout->addWidget(m_sourceList);

    m_infoLabel = new QLabel("No files selected.");
    m_infoLabel->setStyleSheet("font-style: italic;");
    sourceLayout->addWidget(m_infoLabel);

    QHBoxLayout *hButtons = new QHBoxLayout();
    m_btnAddFiles = new QPushButton("Choose files...");
    connect(m_btnAddFiles, &QPushButton::clicked, this, &ConvertTab::browse_input);
    Style::applyShadowEffect(m_btnAddFiles);

    m_btnAddDir = new QPushButton("Add directory...");
    connect(m_btnAddDir, &QPushButton::clicked, this, &ConvertTab::browseDirectoryInput);
    Style::applyShadowEffect(m_btnAddDir);

    m_btnRemove = new QPushButton("Remove selected");
    connect(m_btnRemove, &QPushButton::clicked, this, &ConvertTab::removeSelectedSources);

    m_btnClear = new QPushButton("Clear");
    connect(m_btnClear, &QPushButton::clicked, this, &ConvertTab::clearSources);

    hButtons->addWidget(m_btnAddFiles);
    hButtons->addWidget(m_btnAddDir);
    hButtons->addWidget(m_btnRemove);
    hButtons->addWidget(m_btnClear);
    sourceLayout->addLayout(hButtons);

    m_recursiveCheckbox = new QCheckBox("Include subdirectories when adding a directory");
    sourceLayout->addWidget(m_recursiveCheckbox);

    mainLayout->addWidget(sourceGroup);

    // --- Convert Settings Group ---
    QGroupBox *settingsGroup = new QGroupBox("Convert Settings");
    QFormLayout *settingsLayout = new QFormLayout(settingsGroup);

    m_outputFormat = new QComboBox();
    for (const auto& format : ImageFormat::all()) {
        const QString name = QString::fromStdString(format.name);
        const QString label = QString("%1 (%2)").arg(name.toUpper(), QString::fromStdString(format.extension));
        m_outputFormat->addItem(label, name);
    }
    const int savedFormat = m_outputFormat->findData(m_settings.lastOutputFormat());
    m_outputFormat->setCurrentIndex(savedFormat >= 0 ? savedFormat : 0);
    connect(m_outputFormat, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &ConvertTab::updateEncoderOptions);
    settingsLayout->addRow("Output format:", m_outputFormat);

    QHBoxLayout *hOutput = new QHBoxLayout();
    m_outputPath = new QLineEdit(m_settings.lastOutputDirectory());
    m_outputPath->setPlaceholderText("Existing directory to write the converted images to");
    m_btnOutput = new QPushButton("Browse...");
    connect(m_btnOutput, &QPushButton::clicked, this, &ConvertTab::browse_output);
    Style::applyShadowEffect(m_btnOutput);
    hOutput->addWidget(m_outputPath);
    hOutput->addWidget(m_btnOutput);
    settingsLayout->addRow("Output directory:", hOutput);

    m_jpegQuality = new QSpinBox();
    m_jpegQuality->setRange(0, 100);
    m_jpegQuality->setValue(m_settings.jpegQuality());
    settingsLayout->addRow("JPEG / WebP quality:", m_jpegQuality);

    m_pngCompression = new QSpinBox();
    m_pngCompression->setRange(0, 9);
    m_pngCompression->setValue(m_settings.pngCompression());
    settingsLayout->addRow("PNG compression:", m_pngCompression);

    // Tone mapping applies to HDR/EXR sources written to integer formats
    m_exposure = new QDoubleSpinBox();
    m_exposure->setRange(0.01, 100.0);
    m_exposure->setSingleStep(0.1);
    m_exposure->setValue(m_settings.exposure());
    m_exposure->setToolTip("Radiance multiplier applied to HDR/EXR sources before tone mapping");
    settingsLayout->addRow("HDR exposure:", m_exposure);

    m_gamma = new QDoubleSpinBox();
    m_gamma->setRange(0.1, 10.0);
    m_gamma->setSingleStep(0.1);
    m_gamma->setValue(m_settings.gamma());
    settingsLayout->addRow("HDR gamma:", m_gamma);

    m_background = m_settings.backgroundColor();
    m_btnBackground = new QPushButton();
    m_btnBackground->setToolTip("Fill behind transparent pixels for formats without alpha");
    connect(m_btnBackground, &QPushButton::clicked, this, &ConvertTab::chooseBackground);
    showBackground();
    settingsLayout->addRow("Background:", m_btnBackground);

    mainLayout->addWidget(settingsGroup);

    // --- Run Button ---
    m_runButton = new QPushButton("Run Conversion");
    m_runButton->setStyleSheet(Style::runButtonStyle());
    Style::applyShadowEffect(m_runButton);
    connect(m_runButton, &QPushButton::clicked, this, &ConvertTab::startConversion);
    mainLayout->addWidget(m_runButton);

    m_progress = new QProgressBar();
    m_progress->setRange(0, 1);
    m_progress->setValue(0);
    m_progress->hide();
    mainLayout->addWidget(m_progress);

    // Status label
    m_statusLabel = new QLabel("");
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setStyleSheet("font-style: italic; padding: 8px;");
    mainLayout->addWidget(m_statusLabel);

    // --- Results ---
    m_resultList = new QListWidget();
    m_resultList->setMinimumHeight(90);
    mainLayout->addWidget(m_resultList, 1);

    updateEncoderOptions();
}

void ConvertTab::browse_input()
{
    const QStringList files = QFileDialog::getOpenFileNames(
        this, "Select images to convert", start_directory(m_settings.lastInputDirectory()),
        imageDialogFilter()
    );
    if (files.isEmpty()) {
        return;
    }
    m_settings.setLastInputDirectory(QFileInfo(files.first()).absolutePath());
    addSourceFiles(files);
}

void ConvertTab::browseDirectoryInput()
{
    const QString directory = QFileDialog::getExistingDirectory(
        this, "Select a directory of images", start_directory(m_settings.lastInputDirectory())
    );
    if (directory.isEmpty()) {
        return;
    }
    m_settings.setLastInputDirectory(directory);

    QStringList files;
    for (const auto& path : FileSystemUtil::getImageFiles(directory.toStdString(), m_recursiveCheckbox->isChecked())) {
        files << QString::fromStdString(path.string());
    }
    if (files.isEmpty()) {
        QMessageBox::information(this, "No Images", QString("No image files were found in %1.").arg(directory));
        return;
    }
    const int added = addSourceFiles(files);
    qCInfo(lcUi) << "Added" << added << "image(s) from" << directory;
}

void ConvertTab::browse_output()
{
    const QString directory = QFileDialog::getExistingDirectory(
        this, "Select output directory", start_directory(m_outputPath->text().trimmed())
    );
    if (!directory.isEmpty()) {
        m_outputPath->setText(directory);
    }
}

int ConvertTab::addSourceFiles(const QStringList& files)
{
    QSet<QString> listed;
    for (int i = 0; i < m_sourceList->count(); ++i) {
        listed.insert(m_sourceList->item(i)->data(Qt::UserRole).toString());
    }

    int added = 0;
    for (const QString& file : files) {
        const QString path = QFileInfo(file).absoluteFilePath();
        if (listed.contains(path)) {
            continue;
        }
        listed.insert(path);

        QListWidgetItem *item = new QListWidgetItem(QFileInfo(path).fileName(), m_sourceList);
        item->setData(Qt::UserRole, path);
        item->setToolTip(path);
        ++added;
    }
    updateSelectionInfo();
    return added;
}

QStringList ConvertTab::sourceFiles() const
{
    QStringList files;
    for (int i = 0; i < m_sourceList->count(); ++i) {
        files << m_sourceList->item(i)->data(Qt::UserRole).toString();
    }
    return files;
}

void ConvertTab::removeSelectedSources()
{
    qDeleteAll(m_sourceList->selectedItems());
    updateSelectionInfo();
}

void ConvertTab::clearSources()
{
    m_sourceList->clear();
    updateSelectionInfo();
}

void ConvertTab::updateSelectionInfo()
{
    const int total = m_sourceList->count();
    const auto selected = m_sourceList->selectedItems();

    if (selected.size() == 1) {
        const QString path = selected.first()->data(Qt::UserRole).toString();
        const auto info = ImageUtil::readImageInfo(path.toStdString());
        if (info) {
            m_infoLabel->setText(QString("%1 x %2, %3 channel(s), %4-bit %5, %6")
                .arg(info->width).arg(info->height).arg(info->channels).arg(info->bitDepth)
                .arg(QString::fromStdString(info->format).toUpper(),
                     QString::fromStdString(ImageUtil::formatFileSize(info->fileSize))));
        } else {
            m_infoLabel->setText(QString("%1: not a readable image").arg(QFileInfo(path).fileName()));
        }
        return;
    }

    if (total == 0) {
        m_infoLabel->setText("No files selected.");
    } else {
        m_infoLabel->setText(QString("%1 file(s) selected.").arg(total));
    }
}

void ConvertTab::updateEncoderOptions()
{
    const QString format = m_outputFormat->currentData().toString();
    m_jpegQuality->setEnabled(format == "jpeg" || format == "webp");
    m_pngCompression->setEnabled(format == "png");

    const auto target = ImageFormat::fromString(format.toStdString());
    const bool floatTarget = target && target->floatingPoint;
    m_exposure->setEnabled(!floatTarget);
    m_gamma->setEnabled(!floatTarget);
    m_btnBackground->setEnabled(!target || !target->supportsAlpha);
}

void ConvertTab::chooseBackground()
{
    const QColor current(m_background.red, m_background.green, m_background.blue);
    const QColor chosen = QColorDialog::getColor(current, this, "Background for transparent pixels");
    if (!chosen.isValid()) {
        return;
    }
    m_background = RgbColor{chosen.red(), chosen.green(), chosen.blue()};
    showBackground();
}

void ConvertTab::showBackground()
{
    const QString hex = QString::fromStdString(m_background.toHex());
    m_btnBackground->setText(hex);
    m_btnBackground->setStyleSheet(QString("QPushButton { background-color: %1; color: %2; }")
        .arg(hex, QColor(hex).lightness() > 127 ? "#000000" : "#ffffff"));
}

std::optional<ConversionRequest> ConvertTab::nextRequest()
{
    if (m_sourceList->count() == 0) {
        return std::nullopt;
    }

    ConversionRequest request;
    for (const QString& file : sourceFiles()) {
        request.sources.emplace_back(file.toStdString());
    }
    request.targetFormat = m_outputFormat->currentData().toString().toStdString();
    request.destinationDir = m_outputPath->text().trimmed().toStdString();
    request.options.jpegQuality = m_jpegQuality->value();
    request.options.webpQuality = m_jpegQuality->value();
    request.options.pngCompression = m_pngCompression->value();
    request.options.exposure = m_exposure->value();
    request.options.gamma = m_gamma->value();
    request.options.background = m_background;
    return request;
}

void ConvertTab::store_settings()
{
    m_settings.setLastOutputFormat(m_outputFormat->currentData().toString());
    m_settings.setLastOutputDirectory(m_outputPath->text().trimmed());
    m_settings.setJpegQuality(m_jpegQuality->value());
    m_settings.setPngCompression(m_pngCompression->value());
    m_settings.setExposure(m_exposure->value());
    m_settings.setGamma(m_gamma->value());
    m_settings.setBackgroundColor(m_background);
}

bool ConvertTab::is_busy() const
{
    return m_worker && m_worker->isRunning();
}

void ConvertTab::setRunning(bool running)
{
    m_runButton->setEnabled(!running);
    m_runButton->setText(running ? "Converting..." : "Run Conversion");
    m_btnAddFiles->setEnabled(!running);
    m_btnAddDir->setEnabled(!running);
    m_btnRemove->setEnabled(!running);
    m_btnClear->setEnabled(!running);
    m_outputFormat->setEnabled(!running);
    m_outputPath->setEnabled(!running);
    m_btnOutput->setEnabled(!running);
    if (running) {
        m_jpegQuality->setEnabled(false);
        m_pngCompression->setEnabled(false);
        m_exposure->setEnabled(false);
        m_gamma->setEnabled(false);
        m_btnBackground->setEnabled(false);
    } else {
        updateEncoderOptions();
    }
}

void ConvertTab::startConversion()
{
    if (is_busy()) {
        return;
    }

    const auto request = nextRequest();
    if (!request) {
        QMessageBox::warning(this, "No Input", "Please choose at least one image to convert.");
        return;
    }

    try {
        BatchConverter::validate(*request);
    } catch (const ValidationError& e) {
        m_statusLabel->setText("Conversion not started.");
        QMessageBox::critical(this, "Cannot Convert", QString::fromStdString(e.what()));
        return;
    }

    store_settings();
    if (!m_settings.save()) {
        qCWarning(lcUi) << "Settings were not saved to" << m_settings.filePath();
    }

    const int total = static_cast<int>(request->sources.size());
    m_resultList->clear();
    m_progress->setRange(0, total);
    m_progress->setValue(0);
    m_progress->show();
    m_statusLabel->setText(QString("Converting %1 image(s)...").arg(total));
    setRunning(true);

    m_worker = new ConversionWorker(*request, this);
    connect(m_worker, &ConversionWorker::fileConverted, this, &ConvertTab::onFileConverted, Qt::QueuedConnection);
    connect(m_worker, &ConversionWorker::batchFinished, this, &ConvertTab::onConversionDone, Qt::QueuedConnection);
    connect(m_worker, &ConversionWorker::batchFailed, this, &ConvertTab::onConversionError, Qt::QueuedConnection);

    // Clean up worker when the thread exits
    connect(m_worker, &QThread::finished, this, [this]() {
        if (m_worker) {
            m_worker->deleteLater();
            m_worker = nullptr;
        }
    });

    emit conversionStarted(total);
    m_worker->start();
}

void ConvertTab::onFileConverted(int completed, int total, const QString& source, bool ok, const QString& detail)
{
    m_progress->setMaximum(total);
    m_progress->setValue(completed);

    const QString name = QFileInfo(source).fileName();
    QListWidgetItem *item = new QListWidgetItem(
        ok ? QString("OK    %1 -> %2").arg(name, detail)
           : QString("FAIL  %1: %2").arg(name, detail),
        m_resultList);
    item->setToolTip(source);
    item->setForeground(ok ? Style::SUCCESS_COLOR : Style::FAILURE_COLOR);
    m_resultList->scrollToItem(item);
}

void ConvertTab::onConversionDone(const BatchReport& report)
{
    setRunning(false);
    const QString summary = QString::fromStdString(report.summary());
    m_statusLabel->setText(summary);

    emit conversionFinished(static_cast<int>(report.succeeded()), static_cast<int>(report.failed()));

    if (report.failed() == 0) {
        QMessageBox::information(this, "Success", summary);
    } else {
        QMessageBox::warning(this, "Finished With Errors",
                             summary + "\nSee the list below for the reason each file failed.");
    }
}

void ConvertTab::onConversionError(const QString &msg)
{
    setRunning(false);
    m_progress->hide();
    m_statusLabel->setText("Conversion failed.");
    QMessageBox::critical(this, "Error", msg);
}
