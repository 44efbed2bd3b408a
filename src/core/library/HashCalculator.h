#pragma once

#include <QString>
#include "../CatalogData.h"

// Metadata and partial-content hashing for catalog rows and import candidates.
// All methods are pure given the file bytes and safe to call from worker threads.
class HashCalculator {
public:
    static const QString kNoMetadataHash;   // both artist and title empty
    static const QString kTooLargeSuffix;   // "<size>_FILE_TOO_LARGE"

    static constexpr qint64 kChunkSize = 64 * 1024;
    static constexpr qint64 kTwoChunkThreshold = 2 * kChunkSize;
    static constexpr qint64 kMiddleChunkThreshold = 4 * kChunkSize;
    static constexpr qint64 kMaxHashableSize = 10LL * 1024 * 1024 * 1024;

    // MD5 of "artist|title" after trim + lowercase, or kNoMetadataHash.
    static QString metadataHash(const QString& artist, const QString& title);

    // SHA-256 over the audio payload (leading/trailing tag blocks skipped):
    // payload size + first/middle/last 64 KiB chunks, as "<size>_<hex>".
    // Returns an empty string and sets *error on I/O failure.
    static QString contentHash(const QString& filePath,
                               CurationError* error = nullptr,
                               QString* errorString = nullptr);

    // Lowercase, trimmed, NFD with combining marks removed.
    static QString normalizeArtistKey(const QString& artist);

    static bool isSentinel(const QString& metadataHash);
    static bool isUsableContentHash(const QString& contentHash);
};
