#include "framerenderer.h"
#include "markerstyle.h"
#include "payloadencoder.h"

OpenCvFrameRenderer::OpenCvFrameRenderer()
    : m_rasterizer(1)
{
}

cv::Mat OpenCvFrameRenderer::renderHeaderFrame(const TransferHeader& header) const
{
    return m_rasterizer.rasterize(PayloadEncoder::headerPayload(header), HEADER_SIZE);
}

cv::Mat OpenCvFrameRenderer::renderPageFrame(const PageLayout& layout) const
{
    cv::Mat canvas(layout.rows * CELL_SIZE, layout.columns * CELL_SIZE, CV_8UC3,
                   cv::Scalar(255, 255, 255));

    for (const GridCell& cell : layout.cells) {
        const cv::Rect cellRect(cell.column * CELL_SIZE, cell.row * CELL_SIZE, CELL_SIZE, CELL_SIZE);

        switch (cell.kind) {
            case GridCell::Kind::Marker: {
                const CornerMarker& marker = layout.page.markers.at(static_cast<size_t>(cell.markerIndex));
                drawMarkerCell(canvas, cellRect, PayloadEncoder::markerPayload(marker),
                               MarkerStyleTable::styleFor(marker.position));
                break;
            }
            case GridCell::Kind::Chunk: {
                cv::Mat qr = m_rasterizer.rasterize(PayloadEncoder::chunkPayload(*cell.chunk), QR_SIZE);
                qr.copyTo(canvas(cv::Rect(cellRect.x + CELL_MARGIN, cellRect.y + CELL_MARGIN,
                                          QR_SIZE, QR_SIZE)));
                break;
            }
            case GridCell::Kind::Empty:
                break;
        }
    }

    return canvas;
}

cv::Mat OpenCvFrameRenderer::renderControlFrame(ControlAction action, qint64 timestamp) const
{
    const MarkerStyle style = MarkerStyleTable::styleFor(action);

    cv::Mat image(CONTROL_SIZE, CONTROL_SIZE, CV_8UC3, cv::Scalar(255, 255, 255));

    // Symbol on top, caption in its own band underneath
    const int qrSize = CONTROL_SIZE - 2 * CONTROL_MARGIN - CONTROL_LABEL_HEIGHT;
    const int qrX = (CONTROL_SIZE - qrSize) / 2;
    const int qrY = CONTROL_MARGIN;

    cv::Mat qr = m_rasterizer.rasterize(PayloadEncoder::controlPayload(action, timestamp), qrSize);
    qr.copyTo(image(cv::Rect(qrX, qrY, qrSize, qrSize)));

    drawFrame(image, cv::Rect(0, 0, CONTROL_SIZE, CONTROL_SIZE), style.color);

    const std::string label = style.label.toStdString();
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.8, 2, &baseline);
    cv::Point origin((CONTROL_SIZE - textSize.width) / 2,
                     qrY + qrSize + (CONTROL_LABEL_HEIGHT + textSize.height) / 2);
    cv::putText(image, label, origin, cv::FONT_HERSHEY_SIMPLEX, 0.8, style.color, 2, cv::LINE_AA);

    return image;
}

void OpenCvFrameRenderer::drawMarkerCell(cv::Mat& canvas, const cv::Rect& cellRect,
                                         const QString& payload, const MarkerStyle& style) const
{
    const int qrSize = QR_SIZE - LABEL_HEIGHT;
    const int qrX = cellRect.x + (CELL_SIZE - qrSize) / 2;
    const int qrY = cellRect.y + CELL_MARGIN;

    cv::Mat qr = m_rasterizer.rasterize(payload, qrSize);
    qr.copyTo(canvas(cv::Rect(qrX, qrY, qrSize, qrSize)));

    drawFrame(canvas, cv::Rect(cellRect.x + CELL_MARGIN / 2, cellRect.y + CELL_MARGIN / 2,
                               CELL_SIZE - CELL_MARGIN, CELL_SIZE - CELL_MARGIN),
              style.color);

    const std::string label = style.label.toStdString();
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
    cv::Point origin(cellRect.x + (CELL_SIZE - textSize.width) / 2,
                     qrY + qrSize + (LABEL_HEIGHT + textSize.height) / 2);
    cv::putText(canvas, label, origin, cv::FONT_HERSHEY_SIMPLEX, 0.5, style.color, 1, cv::LINE_AA);
}

void OpenCvFrameRenderer::drawFrame(cv::Mat& image, const cv::Rect& rect, const cv::Scalar& color) const
{
    cv::rectangle(image, rect, color, FRAME_THICKNESS);
}
