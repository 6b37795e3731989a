#include <gtest/gtest.h>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include "payloadencoder.h"

namespace {

QJsonObject parse(const QString& payload)
{
    return QJsonDocument::fromJson(payload.toUtf8()).object();
}

QStringList sortedKeys(const QJsonObject& object)
{
    QStringList keys = object.keys();
    keys.sort();
    return keys;
}

}

TEST(PayloadEncoderTest, HeaderCarriesExactFieldSet)
{
    TransferHeader header;
    header.fileName = "archive.tar";
    header.fileType = ".tar";
    header.originalSize = 123456;
    header.compressedSize = 65432;
    header.compressionType = "gzip";
    header.chunkSize = 800;
    header.totalChunks = 110;
    header.totalPages = 7;
    header.timestamp = 1700000000;

    QJsonObject json = parse(PayloadEncoder::headerPayload(header));

    QStringList expected = {"type", "fileName", "fileType", "originalSize", "compressedSize",
                            "compressed", "compressionType", "totalChunks", "chunkSize",
                            "totalPages", "timestamp"};
    expected.sort();
    EXPECT_EQ(sortedKeys(json), expected);

    EXPECT_EQ(json.value("type").toString(), QString("header"));
    EXPECT_EQ(json.value("fileName").toString(), QString("archive.tar"));
    EXPECT_EQ(json.value("fileType").toString(), QString(".tar"));
    EXPECT_EQ(json.value("originalSize").toInteger(), 123456);
    EXPECT_EQ(json.value("compressedSize").toInteger(), 65432);
    EXPECT_TRUE(json.value("compressed").toBool());
    EXPECT_EQ(json.value("compressionType").toString(), QString("gzip"));
    EXPECT_EQ(json.value("totalChunks").toInt(), 110);
    EXPECT_EQ(json.value("chunkSize").toInt(), 800);
    EXPECT_EQ(json.value("totalPages").toInt(), 7);
    EXPECT_EQ(json.value("timestamp").toInteger(), 1700000000);
}

TEST(PayloadEncoderTest, ChunkPayload)
{
    QJsonObject json = parse(PayloadEncoder::chunkPayload(DataChunk(42, "QUJDRA==")));

    EXPECT_EQ(json.size(), 3);
    EXPECT_EQ(json.value("type").toString(), QString("chunk"));
    EXPECT_EQ(json.value("chunkIndex").toInt(), 42);
    EXPECT_EQ(json.value("data").toString(), QString("QUJDRA=="));
}

TEST(PayloadEncoderTest, MarkerPayloadUsesPositionNames)
{
    CornerMarker marker(CornerPosition::BottomLeft, 3, 9, 1700000123);
    QJsonObject json = parse(PayloadEncoder::markerPayload(marker));

    QStringList expected = {"page", "position", "timestamp", "total", "type"};
    EXPECT_EQ(sortedKeys(json), expected);
    EXPECT_EQ(json.value("type").toString(), QString("control"));
    EXPECT_EQ(json.value("position").toString(), QString("bottom-left"));
    EXPECT_EQ(json.value("page").toInt(), 3);
    EXPECT_EQ(json.value("total").toInt(), 9);

    EXPECT_EQ(parse(PayloadEncoder::markerPayload(CornerMarker(CornerPosition::TopLeft, 1, 1, 0))).value("position").toString(),
              QString("top-left"));
    EXPECT_EQ(parse(PayloadEncoder::markerPayload(CornerMarker(CornerPosition::TopRight, 1, 1, 0))).value("position").toString(),
              QString("top-right"));
    EXPECT_EQ(parse(PayloadEncoder::markerPayload(CornerMarker(CornerPosition::BottomRight, 1, 1, 0))).value("position").toString(),
              QString("bottom-right"));
}

TEST(PayloadEncoderTest, ControlPayloadCarriesAction)
{
    QJsonObject start = parse(PayloadEncoder::controlPayload(ControlAction::RecordingStart, 1700000999));
    EXPECT_EQ(start.size(), 3);
    EXPECT_EQ(start.value("type").toString(), QString("control"));
    EXPECT_EQ(start.value("action").toString(), QString("recording_start"));
    EXPECT_EQ(start.value("timestamp").toInteger(), 1700000999);

    QJsonObject end = parse(PayloadEncoder::controlPayload(ControlAction::RecordingEnd, 0));
    EXPECT_EQ(end.value("action").toString(), QString("recording_end"));
}

TEST(PayloadEncoderTest, PayloadsAreCompact)
{
    QString payload = PayloadEncoder::chunkPayload(DataChunk(0, "abc"));
    EXPECT_FALSE(payload.contains('\n'));
    EXPECT_FALSE(payload.contains(": "));
}
