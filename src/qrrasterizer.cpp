#include "qrrasterizer.h"
#include <QByteArray>
#include <algorithm>
#include <memory>
#include <qrencode.h>

namespace {
struct QRcodeDeleter {
    void operator()(QRcode* code) const { QRcode_free(code); }
};
}

QrRasterizer::QrRasterizer(int border)
    : m_border(std::max(0, border))
{
}

cv::Mat QrRasterizer::moduleMatrix(const QString& payload) const
{
    QByteArray utf8 = payload.toUtf8();

    std::unique_ptr<QRcode, QRcodeDeleter> code(
        QRcode_encodeString(utf8.constData(), 0, QR_ECLEVEL_L, QR_MODE_8, 1));
    if (!code) {
        throw RenderError(QString("QR encoding failed for %1 byte payload")
                              .arg(utf8.size()).toStdString());
    }

    const int width = code->width;
    const int side = width + 2 * m_border;
    cv::Mat modules(side, side, CV_8UC1, cv::Scalar(255));

    for (int y = 0; y < width; ++y) {
        const unsigned char* row = code->data + y * width;
        for (int x = 0; x < width; ++x) {
            // Bit 0 set means a dark module
            if (row[x] & 0x01) {
                modules.at<uchar>(y + m_border, x + m_border) = 0;
            }
        }
    }

    return modules;
}

cv::Mat QrRasterizer::rasterize(const QString& payload, int targetSize) const
{
    if (targetSize < 1) {
        throw RenderError("QR target size must be positive");
    }

    cv::Mat modules = moduleMatrix(payload);

    cv::Mat scaled;
    cv::resize(modules, scaled, cv::Size(targetSize, targetSize), 0, 0, cv::INTER_NEAREST);

    cv::Mat image;
    cv::cvtColor(scaled, image, cv::COLOR_GRAY2BGR);
    return image;
}
