#ifndef FRAMERENDERER_H
#define FRAMERENDERER_H

#include <opencv2/opencv.hpp>
#include "qrrasterizer.h"
#include "transferdata.h"

struct MarkerStyle;

/**
 * Turns payload records into bitmap frames
 * Implementations must be safe to call from a worker thread
 */
class FrameRenderer
{
public:
    virtual ~FrameRenderer() = default;

    /**
     * Render the header as a single enlarged QR symbol
     */
    virtual cv::Mat renderHeaderFrame(const TransferHeader& header) const = 0;

    /**
     * Render a fully assembled page grid
     */
    virtual cv::Mat renderPageFrame(const PageLayout& layout) const = 0;

    /**
     * Render a start/end of capture cue
     * @param action Which boundary this frame marks
     * @param timestamp Seconds since epoch carried in the payload
     */
    virtual cv::Mat renderControlFrame(ControlAction action, qint64 timestamp) const = 0;
};

/**
 * Default renderer: libqrencode symbols composited with OpenCV
 */
class OpenCvFrameRenderer : public FrameRenderer
{
public:
    static constexpr int CELL_SIZE = 250;
    static constexpr int CELL_MARGIN = 10;
    static constexpr int QR_SIZE = CELL_SIZE - 2 * CELL_MARGIN;
    static constexpr int HEADER_SIZE = 600;
    static constexpr int CONTROL_SIZE = 600;
    static constexpr int CONTROL_MARGIN = 30;
    static constexpr int CONTROL_LABEL_HEIGHT = 60;
    static constexpr int LABEL_HEIGHT = 22;
    static constexpr int FRAME_THICKNESS = 4;

    OpenCvFrameRenderer();

    cv::Mat renderHeaderFrame(const TransferHeader& header) const override;
    cv::Mat renderPageFrame(const PageLayout& layout) const override;
    cv::Mat renderControlFrame(ControlAction action, qint64 timestamp) const override;

private:
    /**
     * Draw a marker symbol into its cell, shrunk to leave room for the label
     * @param canvas Page canvas
     * @param cellRect Cell area on the canvas
     * @param payload Marker JSON
     * @param style Frame colour and label
     */
    void drawMarkerCell(cv::Mat& canvas, const cv::Rect& cellRect,
                        const QString& payload, const MarkerStyle& style) const;

    void drawFrame(cv::Mat& image, const cv::Rect& rect, const cv::Scalar& color) const;

    QrRasterizer m_rasterizer;
};

#endif // FRAMERENDERER_H
