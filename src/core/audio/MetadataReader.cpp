#include "MetadataReader.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/dict.h>
}

#include <QFile>
#include <QFileInfo>
#include <QDebug>

static const qint64 kVbrScanBytes = 64 * 1024;

static QString detectFormat(const QString& filePath, AVCodecID codecId)
{
    QString ext = QFileInfo(filePath).suffix().toLower();
    if (ext == QLatin1String("m4a")) {
        if (codecId == AV_CODEC_ID_ALAC) return QStringLiteral("alac");
        return QStringLiteral("m4a");
    }
    if (ext == QLatin1String("aif")) return QStringLiteral("aiff");
    if (!ext.isEmpty()) return ext;

    // Fallback by codec
    switch (codecId) {
    case AV_CODEC_ID_FLAC:    return QStringLiteral("flac");
    case AV_CODEC_ID_ALAC:    return QStringLiteral("alac");
    case AV_CODEC_ID_MP3:     return QStringLiteral("mp3");
    case AV_CODEC_ID_AAC:     return QStringLiteral("aac");
    case AV_CODEC_ID_VORBIS:  return QStringLiteral("ogg");
    case AV_CODEC_ID_OPUS:    return QStringLiteral("opus");
    case AV_CODEC_ID_PCM_S16LE:
    case AV_CODEC_ID_PCM_S24LE:
    case AV_CODEC_ID_PCM_S32LE:
    case AV_CODEC_ID_PCM_F32LE:
        return QStringLiteral("wav");
    case AV_CODEC_ID_PCM_S16BE:
    case AV_CODEC_ID_PCM_S24BE:
        return QStringLiteral("aiff");
    default:
        return QString();
    }
}

static QString getTag(AVDictionary* dict, const char* key)
{
    AVDictionaryEntry* entry = av_dict_get(dict, key, nullptr, AV_DICT_IGNORE_SUFFIX);
    return entry ? QString::fromUtf8(entry->value).trimmed() : QString();
}

bool MetadataReader::readStreamProperties(const QString& filePath, LibraryFile& file)
{
    AVFormatContext* fmtCtx = nullptr;
    if (avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr) < 0)
        return false;

    if (avformat_find_stream_info(fmtCtx, nullptr) < 0) {
        avformat_close_input(&fmtCtx);
        return false;
    }

    int audioIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioIdx < 0) {
        avformat_close_input(&fmtCtx);
        return false;
    }

    AVStream* stream = fmtCtx->streams[audioIdx];
    AVCodecParameters* codecPar = stream->codecpar;

    // Duration
    double durationSecs = 0;
    if (stream->duration != AV_NOPTS_VALUE) {
        durationSecs = stream->duration * av_q2d(stream->time_base);
    } else if (fmtCtx->duration != AV_NOPTS_VALUE) {
        durationSecs = fmtCtx->duration / (double)AV_TIME_BASE;
    }
    file.duration = durationSecs;

    const QString fmt = detectFormat(filePath, codecPar->codec_id);
    if (!fmt.isEmpty())
        file.fileFormat = fmt;

    if (codecPar->sample_rate > 0)
        file.sampleRate = codecPar->sample_rate;

    int64_t br = codecPar->bit_rate;
    if (br <= 0) br = fmtCtx->bit_rate;
    if (br > 0)
        file.bitrate = int(br / 1000);

    if (codecPar->codec_id == AV_CODEC_ID_MP3)
        file.variableBitrate = detectVariableBitrate(filePath);

    avformat_close_input(&fmtCtx);
    return true;
}

bool MetadataReader::readContainerTags(const QString& filePath, LibraryFile& file)
{
    AVFormatContext* fmtCtx = nullptr;
    if (avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr) < 0)
        return false;

    AVDictionary* meta = fmtCtx->metadata;
    if (meta == nullptr && fmtCtx->nb_streams > 0)
        meta = fmtCtx->streams[0]->metadata;   // Ogg/Opus keep comments on the stream

    file.artist = getTag(meta, "artist");
    file.title  = getTag(meta, "title");
    file.album  = getTag(meta, "album");

    QString date = getTag(meta, "date");
    if (date.isEmpty()) date = getTag(meta, "year");
    if (date.size() >= 4)
        file.year = date.left(4).toInt();

    avformat_close_input(&fmtCtx);
    return !file.artist.isEmpty() || !file.title.isEmpty();
}

bool MetadataReader::detectVariableBitrate(const QString& filePath)
{
    QFile f(filePath);
    if (!f.open(QIODevice::ReadOnly))
        return false;

    const QByteArray head = f.read(kVbrScanBytes);
    // "Info" is the CBR variant of the LAME header; only Xing and VBRI mean VBR
    return head.contains("Xing") || head.contains("VBRI");
}
