#ifndef PAYLOADENCODER_H
#define PAYLOADENCODER_H

#include <QJsonObject>
#include <QString>
#include "transferdata.h"

/**
 * @brief Builds the JSON strings carried inside each QR symbol
 *
 * Field names are the wire contract with the receiver; field order is not
 * significant. All payloads are serialized in compact form.
 */
class PayloadEncoder
{
public:
    /**
     * @brief Header payload: {type:"header", fileName, fileType, originalSize,
     *        compressedSize, compressed, compressionType, totalChunks, chunkSize,
     *        totalPages, timestamp}
     */
    static QString headerPayload(const TransferHeader& header);

    /**
     * @brief Chunk payload: {type:"chunk", chunkIndex, data}
     */
    static QString chunkPayload(const DataChunk& chunk);

    /**
     * @brief Page marker payload: {type:"control", position, page, total, timestamp}
     */
    static QString markerPayload(const CornerMarker& marker);

    /**
     * @brief Capture boundary payload: {type:"control", action, timestamp}
     */
    static QString controlPayload(ControlAction action, qint64 timestamp);

    static QJsonObject headerToJson(const TransferHeader& header);
    static QJsonObject chunkToJson(const DataChunk& chunk);
    static QJsonObject markerToJson(const CornerMarker& marker);

private:
    static QString toCompactString(const QJsonObject& object);
};

#endif // PAYLOADENCODER_H
