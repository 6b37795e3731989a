#include "fileprocessor.h"
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <algorithm>
#include <exception>

FileProcessor::FileProcessor(int chunkSize, int compressionLevel)
    : m_codec(CompressionCodec::preferredAlgorithm(), compressionLevel),
      m_chunkSize(std::max(1, chunkSize)),
      m_lastError(Error::None)
{
}

FileProcessor::FileProcessor(const CompressionCodec& codec, int chunkSize)
    : m_codec(codec),
      m_chunkSize(std::max(1, chunkSize)),
      m_lastError(Error::None)
{
}

bool FileProcessor::processFile(const QString& filePath, TransferData& result)
{
    m_lastError = Error::None;
    m_lastErrorString.clear();

    QFileInfo fileInfo(filePath);
    if (!fileInfo.exists() || !fileInfo.isFile()) {
        setError(Error::FileReadFailure, QString("File not found: %1").arg(filePath));
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(Error::FileReadFailure,
                 QString("Cannot open %1: %2").arg(filePath, file.errorString()));
        return false;
    }

    QByteArray fileData = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        setError(Error::FileReadFailure,
                 QString("Cannot read %1: %2").arg(filePath, file.errorString()));
        return false;
    }
    file.close();

    QByteArray compressed;
    try {
        compressed = m_codec.compress(fileData);
    } catch (const std::exception& e) {
        setError(Error::CodecFailure,
                 QString("Compression failed for %1: %2").arg(fileInfo.fileName(), e.what()));
        return false;
    }

    QString encoded = QString::fromLatin1(compressed.toBase64());

    TransferData data;
    data.chunks = splitIntoChunks(encoded, m_chunkSize);

    TransferHeader& header = data.header;
    header.fileName = fileInfo.fileName();
    // Hidden files such as ".bashrc" have no suffix
    if (!fileInfo.suffix().isEmpty() && !fileInfo.completeBaseName().isEmpty()) {
        header.fileType = "." + fileInfo.suffix();
    }
    header.originalSize = fileData.size();
    header.compressedSize = compressed.size();
    header.compressionType = m_codec.algorithmId();
    header.chunkSize = m_chunkSize;
    header.totalChunks = data.chunkCount();
    header.timestamp = QDateTime::currentSecsSinceEpoch();

    qDebug() << "FileProcessor:" << header.fileName
             << "original" << header.originalSize
             << "compressed" << header.compressedSize
             << "(" << header.compressionType << ")"
             << "chunks" << header.totalChunks;

    result = std::move(data);
    return true;
}

std::vector<DataChunk> FileProcessor::splitIntoChunks(const QString& encoded, int chunkSize)
{
    std::vector<DataChunk> chunks;
    if (encoded.isEmpty() || chunkSize < 1) {
        return chunks;
    }

    const int length = static_cast<int>(encoded.size());
    const int chunkCount = (length + chunkSize - 1) / chunkSize;
    chunks.reserve(static_cast<size_t>(chunkCount));

    for (int i = 0; i < chunkCount; ++i) {
        chunks.emplace_back(i, encoded.mid(i * chunkSize, chunkSize));
    }

    return chunks;
}

QString FileProcessor::formatSize(qint64 bytes)
{
    static const char* const units[] = {"B", "KB", "MB", "GB"};

    double size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            return QString("%1 %2").arg(size, 0, 'f', 1).arg(unit);
        }
        size /= 1024.0;
    }
    return QString("%1 TB").arg(size, 0, 'f', 1);
}

void FileProcessor::setError(Error error, const QString& message)
{
    m_lastError = error;
    m_lastErrorString = message;
    qWarning() << "FileProcessor:" << message;
}
