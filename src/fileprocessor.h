#ifndef FILEPROCESSOR_H
#define FILEPROCESSOR_H

#include <QString>
#include <vector>
#include "compressioncodec.h"
#include "transferdata.h"

/**
 * Turns a file on disk into a transfer header plus ordered chunks
 *
 * Pipeline: read whole file -> compress -> Base64 -> split into fixed-size
 * substrings. Either a complete result is produced or nothing is.
 */
class FileProcessor
{
public:
    enum class Error {
        None,
        FileReadFailure,    // Missing or unreadable path
        CodecFailure        // Compression library fault
    };

    /**
     * @param chunkSize Characters per chunk (values below 1 are raised to 1)
     * @param compressionLevel Level passed to the preferred codec
     */
    explicit FileProcessor(int chunkSize = DEFAULT_CHUNK_SIZE,
                           int compressionLevel = CompressionCodec::DEFAULT_LEVEL);

    /**
     * Constructor with an explicit codec
     * @param codec Codec used for compression
     * @param chunkSize Characters per chunk
     */
    FileProcessor(const CompressionCodec& codec, int chunkSize);

    /**
     * Load, compress, encode and split a file
     * @param filePath Path of the file to send
     * @param result Filled only on success; untouched on failure
     * @return true if successful, false otherwise (see lastError())
     */
    bool processFile(const QString& filePath, TransferData& result);

    /**
     * Split encoded text into chunks of chunkSize characters
     * @param encoded Base64 text
     * @param chunkSize Characters per chunk (must be >= 1)
     * @return ceil(length / chunkSize) chunks; empty text yields none
     */
    static std::vector<DataChunk> splitIntoChunks(const QString& encoded, int chunkSize);

    /**
     * Format a byte count for display, e.g. "1.5 MB"
     */
    static QString formatSize(qint64 bytes);

    int chunkSize() const { return m_chunkSize; }
    const CompressionCodec& codec() const { return m_codec; }

    Error lastError() const { return m_lastError; }
    QString lastErrorString() const { return m_lastErrorString; }

    static constexpr int DEFAULT_CHUNK_SIZE = 800;

private:
    void setError(Error error, const QString& message);

    CompressionCodec m_codec;
    int m_chunkSize;
    Error m_lastError;
    QString m_lastErrorString;
};

#endif // FILEPROCESSOR_H
