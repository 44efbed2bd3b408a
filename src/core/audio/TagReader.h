#pragma once

#include <QString>
#include "../CatalogData.h"

class TagReader {
public:
    // Artist/title/album/year via TagLib. Returns false if the file has no
    // readable tag block.
    static bool readTags(const QString& filePath, LibraryFile& file);
};
