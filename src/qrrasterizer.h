#ifndef QRRASTERIZER_H
#define QRRASTERIZER_H

#include <QString>
#include <stdexcept>
#include <opencv2/opencv.hpp>

/**
 * Thrown when a payload cannot be turned into an image
 */
class RenderError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Encodes a text payload as a QR symbol and rasterizes it with libqrencode
 *
 * Error correction level L, automatic version selection, 8-bit byte mode.
 */
class QrRasterizer
{
public:
    /**
     * @param border Quiet zone width in modules
     */
    explicit QrRasterizer(int border = 1);

    /**
     * Render a payload as a square BGR image
     * @param payload Text to encode (UTF-8)
     * @param targetSize Output side length in pixels
     * @return Black on white QR image of targetSize x targetSize
     * @throws RenderError if the payload exceeds QR capacity or targetSize < 1
     */
    cv::Mat rasterize(const QString& payload, int targetSize) const;

    /**
     * Module matrix without scaling, including the quiet zone (0 = black, 255 = white)
     */
    cv::Mat moduleMatrix(const QString& payload) const;

    int border() const { return m_border; }

private:
    int m_border;
};

#endif // QRRASTERIZER_H
