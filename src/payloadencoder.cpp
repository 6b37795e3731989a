#include "payloadencoder.h"
#include <QJsonDocument>

QString PayloadEncoder::headerPayload(const TransferHeader& header)
{
    return toCompactString(headerToJson(header));
}

QString PayloadEncoder::chunkPayload(const DataChunk& chunk)
{
    return toCompactString(chunkToJson(chunk));
}

QString PayloadEncoder::markerPayload(const CornerMarker& marker)
{
    return toCompactString(markerToJson(marker));
}

QString PayloadEncoder::controlPayload(ControlAction action, qint64 timestamp)
{
    QJsonObject json;
    json["type"] = "control";
    json["action"] = controlActionName(action);
    json["timestamp"] = timestamp;
    return toCompactString(json);
}

QJsonObject PayloadEncoder::headerToJson(const TransferHeader& header)
{
    QJsonObject json;
    json["type"] = "header";
    json["fileName"] = header.fileName;
    json["fileType"] = header.fileType;
    json["originalSize"] = header.originalSize;
    json["compressedSize"] = header.compressedSize;
    json["compressed"] = true;
    json["compressionType"] = header.compressionType;
    json["totalChunks"] = header.totalChunks;
    json["chunkSize"] = header.chunkSize;
    json["totalPages"] = header.totalPages;
    json["timestamp"] = header.timestamp;
    return json;
}

QJsonObject PayloadEncoder::chunkToJson(const DataChunk& chunk)
{
    QJsonObject json;
    json["type"] = "chunk";
    json["chunkIndex"] = chunk.index;
    json["data"] = chunk.data;
    return json;
}

QJsonObject PayloadEncoder::markerToJson(const CornerMarker& marker)
{
    QJsonObject json;
    json["type"] = "control";
    json["position"] = cornerPositionName(marker.position);
    json["page"] = marker.page;
    json["total"] = marker.total;
    json["timestamp"] = marker.timestamp;
    return json;
}

QString PayloadEncoder::toCompactString(const QJsonObject& object)
{
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
}
