#pragma once

#include <QFileInfo>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include "audio/IMetadataExtractor.h"

// Tags keyed by file name; files without an entry report no tags.
class FakeMetadataExtractor : public IMetadataExtractor {
public:
    struct Tags {
        QString artist;
        QString title;
        QString album;
        int bitrate = 0;
        bool vbr = false;
        int sampleRate = 44100;
    };

    void set(const QString& fileName, const Tags& tags)
    {
        QMutexLocker lock(&m_mutex);
        m_tags.insert(fileName, tags);
    }

    void set(const QString& fileName, const QString& artist, const QString& title,
             int bitrate = 0, int sampleRate = 44100)
    {
        Tags t;
        t.artist = artist;
        t.title = title;
        t.bitrate = bitrate;
        t.sampleRate = sampleRate;
        set(fileName, t);
    }

    bool extract(const QString& filePath, LibraryFile& file, QString* errorString) override
    {
        QMutexLocker lock(&m_mutex);
        const QString name = QFileInfo(filePath).fileName();
        file.fileFormat = QFileInfo(filePath).suffix().toLower();
        auto it = m_tags.constFind(name);
        if (it == m_tags.constEnd()) {
            if (errorString) *errorString = QStringLiteral("no tags");
            return false;
        }
        file.artist = it->artist;
        file.title = it->title;
        file.album = it->album;
        file.bitrate = it->bitrate;
        file.variableBitrate = it->vbr;
        file.sampleRate = it->sampleRate;
        return true;
    }

private:
    QMutex m_mutex;
    QHash<QString, Tags> m_tags;
};
