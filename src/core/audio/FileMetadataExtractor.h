#pragma once

#include "IMetadataExtractor.h"

// Production extractor: TagLib for tags, FFmpeg for stream properties.
class FileMetadataExtractor : public IMetadataExtractor {
public:
    bool extract(const QString& filePath, LibraryFile& file,
                 QString* errorString = nullptr) override;
};
