#include "BaseTab.h"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

BaseTab::BaseTab(ImageConverter::AppSettings& settings, QWidget *parent)
    : QWidget(parent), m_settings(settings)
{
}

QString BaseTab::start_directory(const QString& remembered)
{
    if (!remembered.isEmpty() && QFileInfo(remembered).isDir()) {
        return remembered;
    }
    const QString pictures = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    if (!pictures.isEmpty() && QFileInfo(pictures).isDir()) {
        return pictures;
    }
    return QDir::homePath();
}
