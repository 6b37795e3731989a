#include "compressioncodec.h"
#include <QDebug>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

#ifdef HAVE_ZSTD
#include <zstd.h>
#endif

namespace {

// gzip container instead of a raw zlib stream
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int STREAM_BUFFER_SIZE = 64 * 1024;

}

CompressionCodec::CompressionCodec(Algorithm algorithm, int level)
    : m_algorithm(algorithm),
      m_level(level)
{
    if (!isAvailable(m_algorithm)) {
        throw std::runtime_error("Compression algorithm not available in this build: " +
                                 algorithmName(m_algorithm).toStdString());
    }
}

QByteArray CompressionCodec::compress(const QByteArray& data) const
{
    if (m_algorithm == Algorithm::Zstd) {
        return compressZstd(data);
    }
    return compressGzip(data);
}

QByteArray CompressionCodec::decompress(const QByteArray& data) const
{
    if (m_algorithm == Algorithm::Zstd) {
        return decompressZstd(data);
    }
    return decompressGzip(data);
}

QByteArray CompressionCodec::decompress(const QByteArray& data, const QString& algorithmId)
{
    Algorithm algorithm;
    if (!algorithmFromName(algorithmId, algorithm)) {
        throw std::runtime_error("Unknown compression type: " + algorithmId.toStdString());
    }
    return CompressionCodec(algorithm).decompress(data);
}

CompressionCodec::Algorithm CompressionCodec::preferredAlgorithm()
{
    static const Algorithm preferred = []() {
        Algorithm selected = isAvailable(Algorithm::Zstd) ? Algorithm::Zstd : Algorithm::Gzip;
        qDebug() << "CompressionCodec: using" << algorithmName(selected);
        return selected;
    }();
    return preferred;
}

bool CompressionCodec::isAvailable(Algorithm algorithm)
{
    switch (algorithm) {
        case Algorithm::Zstd:
#ifdef HAVE_ZSTD
            return true;
#else
            return false;
#endif
        case Algorithm::Gzip:
            return true;
        default:
            return false;
    }
}

QString CompressionCodec::algorithmName(Algorithm algorithm)
{
    switch (algorithm) {
        case Algorithm::Zstd:
            return "zstd";
        case Algorithm::Gzip:
            return "gzip";
        default:
            return "gzip";
    }
}

bool CompressionCodec::algorithmFromName(const QString& name, Algorithm& algorithm)
{
    if (name == "zstd") {
        algorithm = Algorithm::Zstd;
        return true;
    } else if (name == "gzip") {
        algorithm = Algorithm::Gzip;
        return true;
    }
    return false;
}

QByteArray CompressionCodec::compressGzip(const QByteArray& data) const
{
    z_stream stream = {};
    int level = std::min(std::max(m_level, 1), 9);

    if (deflateInit2(&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());

    QByteArray output;
    std::vector<char> buffer(STREAM_BUFFER_SIZE);
    int ret = Z_OK;

    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());

        ret = deflate(&stream, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            throw std::runtime_error("deflate failed");
        }

        output.append(buffer.data(), static_cast<int>(buffer.size() - stream.avail_out));
    } while (ret != Z_STREAM_END);

    deflateEnd(&stream);
    return output;
}

QByteArray CompressionCodec::decompressGzip(const QByteArray& data) const
{
    z_stream stream = {};

    if (inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());

    QByteArray output;
    std::vector<char> buffer(STREAM_BUFFER_SIZE);
    int ret = Z_OK;

    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            std::string message = stream.msg ? stream.msg : "inflate failed";
            inflateEnd(&stream);
            throw std::runtime_error("gzip: " + message);
        }
        if (ret == Z_BUF_ERROR) {
            // No progress possible: input exhausted before the end of the stream
            inflateEnd(&stream);
            throw std::runtime_error("gzip: truncated stream");
        }

        output.append(buffer.data(), static_cast<int>(buffer.size() - stream.avail_out));
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return output;
}

QByteArray CompressionCodec::compressZstd(const QByteArray& data) const
{
#ifdef HAVE_ZSTD
    size_t bound = ZSTD_compressBound(static_cast<size_t>(data.size()));
    QByteArray output(static_cast<qsizetype>(bound), Qt::Uninitialized);

    size_t written = ZSTD_compress(output.data(), bound,
                                   data.constData(), static_cast<size_t>(data.size()),
                                   m_level);
    if (ZSTD_isError(written)) {
        throw std::runtime_error(std::string("zstd: ") + ZSTD_getErrorName(written));
    }

    output.resize(static_cast<qsizetype>(written));
    return output;
#else
    Q_UNUSED(data)
    throw std::runtime_error("zstd support not compiled in");
#endif
}

QByteArray CompressionCodec::decompressZstd(const QByteArray& data) const
{
#ifdef HAVE_ZSTD
    unsigned long long contentSize = ZSTD_getFrameContentSize(data.constData(), static_cast<size_t>(data.size()));
    if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
        throw std::runtime_error("zstd: not a valid frame");
    }
    if (contentSize == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw std::runtime_error("zstd: frame does not record its content size");
    }

    QByteArray output(static_cast<qsizetype>(contentSize), Qt::Uninitialized);
    size_t decoded = ZSTD_decompress(output.data(), static_cast<size_t>(output.size()),
                                     data.constData(), static_cast<size_t>(data.size()));
    if (ZSTD_isError(decoded)) {
        throw std::runtime_error(std::string("zstd: ") + ZSTD_getErrorName(decoded));
    }

    output.resize(static_cast<qsizetype>(decoded));
    return output;
#else
    Q_UNUSED(data)
    throw std::runtime_error("zstd support not compiled in");
#endif
}
