#include "FileMetadataExtractor.h"
#include "MetadataReader.h"
#include "TagReader.h"

#include <QFileInfo>
#include <QDebug>

bool FileMetadataExtractor::extract(const QString& filePath, LibraryFile& file,
                                    QString* errorString)
{
    QFileInfo fi(filePath);
    file.filePath = filePath;
    file.filename = fi.fileName();
    if (file.fileFormat.isEmpty())
        file.fileFormat = fi.suffix().toLower();

    bool streamOk = MetadataReader::readStreamProperties(filePath, file);
    bool tagsOk = TagReader::readTags(filePath, file);

    // FFmpeg's container dictionary covers formats TagLib can't open
    if (!tagsOk && streamOk)
        tagsOk = MetadataReader::readContainerTags(filePath, file);

    if (!tagsOk) {
        if (errorString)
            *errorString = QStringLiteral("Unreadable tags in %1").arg(fi.fileName());
        qDebug() << "[Metadata] No tags for" << filePath
                 << "(stream properties" << (streamOk ? "ok)" : "unavailable)");
        return false;
    }
    return true;
}
