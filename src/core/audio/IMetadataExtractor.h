#pragma once

#include <QString>
#include "../CatalogData.h"

// Reads tags and stream properties for one file into a LibraryFile.
// Implementations must be safe to call concurrently from worker threads.
class IMetadataExtractor {
public:
    virtual ~IMetadataExtractor() = default;

    // Fills artist/title/album/year and duration/format/bitrate/VBR/sample
    // rate. Returns false when tags could not be parsed; fields that were
    // readable are still filled in.
    virtual bool extract(const QString& filePath, LibraryFile& file,
                         QString* errorString = nullptr) = 0;
};
