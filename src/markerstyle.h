#ifndef MARKERSTYLE_H
#define MARKERSTYLE_H

#include <QString>
#include <opencv2/opencv.hpp>
#include "transferdata.h"

/**
 * Visual decoration drawn around a marker or control symbol
 * Colors are BGR as used by OpenCV
 */
struct MarkerStyle {
    QString label;
    cv::Scalar color;

    MarkerStyle() : color(0, 0, 0) {}
    MarkerStyle(const QString& text, const cv::Scalar& bgr) : label(text), color(bgr) {}
};

/**
 * Fixed lookup table from marker position or control action to its style
 */
class MarkerStyleTable
{
public:
    /**
     * Style for a corner marker: TL red, TR green, BL blue, BR orange
     */
    static MarkerStyle styleFor(CornerPosition position);

    /**
     * Style for a capture boundary frame: start green, end red
     */
    static MarkerStyle styleFor(ControlAction action);
};

#endif // MARKERSTYLE_H
