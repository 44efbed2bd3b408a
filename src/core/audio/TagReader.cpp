#include "TagReader.h"

#include <QDebug>

#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tpropertymap.h>

static QString toQString(const TagLib::String& s)
{
    return QString::fromStdString(s.to8Bit(true)).trimmed();
}

bool TagReader::readTags(const QString& filePath, LibraryFile& file)
{
    TagLib::FileRef f(filePath.toUtf8().constData(), false);
    if (f.isNull() || !f.tag())
        return false;

    TagLib::Tag* tag = f.tag();
    file.title  = toQString(tag->title());
    file.artist = toQString(tag->artist());
    file.album  = toQString(tag->album());
    file.year   = int(tag->year());

    // Fall back to ALBUMARTIST when the track artist is missing
    if (file.artist.isEmpty()) {
        TagLib::PropertyMap props = f.file()->properties();
        if (props.contains("ALBUMARTIST")) {
            auto vals = props["ALBUMARTIST"];
            if (!vals.isEmpty())
                file.artist = toQString(vals.front());
        }
    }

    return !file.artist.isEmpty() || !file.title.isEmpty();
}
