#pragma once

#include <QString>
#include "../CatalogData.h"

class MetadataReader {
public:
    // Duration, format, bitrate, sample rate and VBR flag via FFmpeg.
    static bool readStreamProperties(const QString& filePath, LibraryFile& file);

    // Artist/title/album/year from the container metadata dictionary.
    static bool readContainerTags(const QString& filePath, LibraryFile& file);

    // Scans the first MPEG frame for a Xing/VBRI header.
    static bool detectVariableBitrate(const QString& filePath);
};
