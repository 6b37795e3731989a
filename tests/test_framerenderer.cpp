#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <opencv2/objdetect.hpp>
#include "framelayout.h"
#include "framerenderer.h"
#include "markerstyle.h"
#include "payloadencoder.h"
#include "qrrasterizer.h"

namespace {

std::shared_ptr<const TransferData> makeTransfer(int chunkCount)
{
    auto data = std::make_shared<TransferData>();
    for (int i = 0; i < chunkCount; ++i) {
        data->chunks.emplace_back(i, QString(300, QChar('A' + i % 26)));
    }
    data->header.fileName = "frame.bin";
    data->header.compressionType = "gzip";
    data->header.chunkSize = 300;
    data->header.totalChunks = chunkCount;
    return data;
}

bool isWhite(const cv::Mat& image, const cv::Rect& area)
{
    cv::Mat gray;
    cv::cvtColor(image(area), gray, cv::COLOR_BGR2GRAY);
    double minValue = 0.0;
    cv::minMaxLoc(gray, &minValue);
    return minValue >= 255.0;
}

bool sameColor(const cv::Scalar& a, const cv::Scalar& b)
{
    return a[0] == b[0] && a[1] == b[1] && a[2] == b[2];
}

// True when no coloured label or frame pixel reaches the area
bool isMonochrome(const cv::Mat& image, const cv::Rect& area)
{
    const cv::Mat region = image(area);
    for (int y = 0; y < region.rows; ++y) {
        for (int x = 0; x < region.cols; ++x) {
            const cv::Vec3b pixel = region.at<cv::Vec3b>(y, x);
            if (pixel[0] != pixel[1] || pixel[1] != pixel[2]) {
                return false;
            }
        }
    }
    return true;
}

std::string decodeSymbol(const cv::Mat& image, const cv::Rect& area)
{
    cv::Mat padded;
    cv::copyMakeBorder(image(area), padded, 40, 40, 40, 40, cv::BORDER_CONSTANT,
                       cv::Scalar(255, 255, 255));
    cv::QRCodeDetector detector;
    return detector.detectAndDecode(padded);
}

cv::Rect controlSymbolArea()
{
    const int size = OpenCvFrameRenderer::CONTROL_SIZE - 2 * OpenCvFrameRenderer::CONTROL_MARGIN
                     - OpenCvFrameRenderer::CONTROL_LABEL_HEIGHT;
    return cv::Rect((OpenCvFrameRenderer::CONTROL_SIZE - size) / 2, OpenCvFrameRenderer::CONTROL_MARGIN,
                    size, size);
}

}

TEST(QrRasterizerTest, ProducesSquareBlackAndWhiteImage)
{
    QrRasterizer rasterizer;
    cv::Mat image = rasterizer.rasterize("{\"type\":\"chunk\",\"chunkIndex\":0,\"data\":\"QUJD\"}", 230);

    EXPECT_EQ(image.rows, 230);
    EXPECT_EQ(image.cols, 230);
    EXPECT_EQ(image.type(), CV_8UC3);

    double minValue = 0.0;
    double maxValue = 0.0;
    cv::Mat gray;
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    cv::minMaxLoc(gray, &minValue, &maxValue);
    EXPECT_EQ(minValue, 0.0);
    EXPECT_EQ(maxValue, 255.0);
}

TEST(QrRasterizerTest, ModuleMatrixHasQuietZone)
{
    QrRasterizer rasterizer(2);
    cv::Mat modules = rasterizer.moduleMatrix("hello");

    // Smallest QR version is 21 modules wide
    ASSERT_GE(modules.rows, 21 + 4);
    EXPECT_EQ(modules.rows, modules.cols);
    EXPECT_EQ(cv::countNonZero(modules.row(0)), modules.cols);
    EXPECT_EQ(modules.at<uchar>(2, 2), 0);   // Finder pattern corner
}

TEST(QrRasterizerTest, OversizedPayloadThrows)
{
    QrRasterizer rasterizer;
    QString payload(8000, QChar('x'));
    EXPECT_THROW(rasterizer.rasterize(payload, 100), RenderError);
}

TEST(QrRasterizerTest, InvalidSizeThrows)
{
    QrRasterizer rasterizer;
    EXPECT_THROW(rasterizer.rasterize("abc", 0), RenderError);
}

TEST(OpenCvFrameRendererTest, HeaderFrameSize)
{
    OpenCvFrameRenderer renderer;
    FrameLayoutEngine engine(makeTransfer(3), GridConfig(5, 4, MarkerMode::FourCorner));

    cv::Mat frame = renderer.renderHeaderFrame(engine.header());
    EXPECT_EQ(frame.cols, OpenCvFrameRenderer::HEADER_SIZE);
    EXPECT_EQ(frame.rows, OpenCvFrameRenderer::HEADER_SIZE);
}

TEST(OpenCvFrameRendererTest, PageFrameMatchesGridAndLeavesEmptyCellsWhite)
{
    OpenCvFrameRenderer renderer;
    FrameLayoutEngine engine(makeTransfer(20), GridConfig(5, 4, MarkerMode::FourCorner));

    PageLayout layout = engine.layoutPage(engine.page(2, 0));
    cv::Mat frame = renderer.renderPageFrame(layout);

    const int cell = OpenCvFrameRenderer::CELL_SIZE;
    EXPECT_EQ(frame.cols, 5 * cell);
    EXPECT_EQ(frame.rows, 4 * cell);

    for (const GridCell& gridCell : layout.cells) {
        cv::Rect area(gridCell.column * cell, gridCell.row * cell, cell, cell);
        if (gridCell.kind == GridCell::Kind::Empty) {
            EXPECT_TRUE(isWhite(frame, area)) << "cell " << gridCell.row << "," << gridCell.column;
        } else {
            EXPECT_FALSE(isWhite(frame, area)) << "cell " << gridCell.row << "," << gridCell.column;
        }
    }
}

TEST(OpenCvFrameRendererTest, ControlFrameSize)
{
    OpenCvFrameRenderer renderer;
    cv::Mat frame = renderer.renderControlFrame(ControlAction::RecordingStart, 1700000000);
    EXPECT_EQ(frame.cols, OpenCvFrameRenderer::CONTROL_SIZE);
    EXPECT_EQ(frame.rows, OpenCvFrameRenderer::CONTROL_SIZE);
}

TEST(OpenCvFrameRendererTest, ControlCaptionStaysOutOfSymbol)
{
    OpenCvFrameRenderer renderer;
    for (ControlAction action : {ControlAction::RecordingStart, ControlAction::RecordingEnd}) {
        cv::Mat frame = renderer.renderControlFrame(action, 1700000000);
        EXPECT_TRUE(isMonochrome(frame, controlSymbolArea())) << controlActionName(action).toStdString();
    }
}

TEST(OpenCvFrameRendererTest, ControlFrameDecodesToControlPayload)
{
    OpenCvFrameRenderer renderer;
    for (ControlAction action : {ControlAction::RecordingStart, ControlAction::RecordingEnd}) {
        cv::Mat frame = renderer.renderControlFrame(action, 1700000000);

        // Whole frame, coloured border and caption included
        EXPECT_EQ(decodeSymbol(frame, cv::Rect(0, 0, frame.cols, frame.rows)),
                  PayloadEncoder::controlPayload(action, 1700000000).toStdString());
    }
}

TEST(OpenCvFrameRendererTest, MarkerCellDecodesToMarkerPayload)
{
    OpenCvFrameRenderer renderer;
    FrameLayoutEngine engine(makeTransfer(20), GridConfig(5, 4, MarkerMode::FourCorner));
    PageLayout layout = engine.layoutPage(engine.page(1, 1700000000));
    cv::Mat frame = renderer.renderPageFrame(layout);

    const GridCell& cell = layout.cellAt(0, 0);
    ASSERT_EQ(cell.kind, GridCell::Kind::Marker);
    const CornerMarker& marker = layout.page.markers.at(static_cast<size_t>(cell.markerIndex));

    const int cellSize = OpenCvFrameRenderer::CELL_SIZE;
    const int symbolSize = OpenCvFrameRenderer::QR_SIZE - OpenCvFrameRenderer::LABEL_HEIGHT;
    const cv::Rect symbolArea((cellSize - symbolSize) / 2, OpenCvFrameRenderer::CELL_MARGIN,
                              symbolSize, symbolSize);

    EXPECT_TRUE(isMonochrome(frame, symbolArea));
    EXPECT_EQ(decodeSymbol(frame, symbolArea), PayloadEncoder::markerPayload(marker).toStdString());
}

TEST(MarkerStyleTableTest, EveryCornerHasDistinctStyle)
{
    const CornerPosition positions[] = {CornerPosition::TopLeft, CornerPosition::TopRight,
                                        CornerPosition::BottomLeft, CornerPosition::BottomRight};
    for (CornerPosition a : positions) {
        for (CornerPosition b : positions) {
            if (a == b) {
                continue;
            }
            MarkerStyle styleA = MarkerStyleTable::styleFor(a);
            MarkerStyle styleB = MarkerStyleTable::styleFor(b);
            EXPECT_NE(styleA.label, styleB.label);
            EXPECT_FALSE(sameColor(styleA.color, styleB.color));
        }
    }

    EXPECT_FALSE(sameColor(MarkerStyleTable::styleFor(ControlAction::RecordingStart).color,
                           MarkerStyleTable::styleFor(ControlAction::RecordingEnd).color));
}
