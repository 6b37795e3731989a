#ifndef COMPRESSIONCODEC_H
#define COMPRESSIONCODEC_H

#include <QByteArray>
#include <QString>

/**
 * Byte-stream compressor used before text encoding
 *
 * Zstandard is preferred when the build found libzstd; otherwise a gzip
 * container produced by zlib is used. The algorithm is fixed for the process
 * lifetime and its name is written verbatim into the transfer header, so a
 * receiver never has to guess which decompressor to use.
 *
 * Library faults are reported by throwing std::runtime_error.
 */
class CompressionCodec
{
public:
    enum class Algorithm {
        Zstd,
        Gzip
    };

    /**
     * Create a codec for the given algorithm
     * @param algorithm Compression algorithm (defaults to the process-wide preferred one)
     * @param level Compression level (gzip uses at most 9)
     */
    explicit CompressionCodec(Algorithm algorithm = preferredAlgorithm(), int level = DEFAULT_LEVEL);

    /**
     * Compress a byte buffer; empty input yields a valid (non-empty) stream
     * @param data Raw bytes
     * @return Compressed bytes
     */
    QByteArray compress(const QByteArray& data) const;

    /**
     * Reverse compress() for this codec's algorithm
     * @param data Compressed bytes
     * @return Original bytes
     */
    QByteArray decompress(const QByteArray& data) const;

    /**
     * Decompress using the algorithm named in a transfer header
     * @param data Compressed bytes
     * @param algorithmId "zstd" or "gzip"
     * @return Original bytes
     */
    static QByteArray decompress(const QByteArray& data, const QString& algorithmId);

    Algorithm algorithm() const { return m_algorithm; }
    int level() const { return m_level; }

    /**
     * Name recorded in the header's compressionType field
     */
    QString algorithmId() const { return algorithmName(m_algorithm); }

    /**
     * Best algorithm available to this build, selected once at first use
     */
    static Algorithm preferredAlgorithm();

    /**
     * Check whether the algorithm was compiled in
     */
    static bool isAvailable(Algorithm algorithm);

    static QString algorithmName(Algorithm algorithm);
    static bool algorithmFromName(const QString& name, Algorithm& algorithm);

    static constexpr int DEFAULT_LEVEL = 3;

private:
    QByteArray compressGzip(const QByteArray& data) const;
    QByteArray decompressGzip(const QByteArray& data) const;
    QByteArray compressZstd(const QByteArray& data) const;
    QByteArray decompressZstd(const QByteArray& data) const;

    Algorithm m_algorithm;
    int m_level;
};

#endif // COMPRESSIONCODEC_H
