#include "markerstyle.h"

namespace {
const cv::Scalar RED(0, 0, 255);
const cv::Scalar GREEN(0, 170, 0);
const cv::Scalar BLUE(255, 0, 0);
const cv::Scalar ORANGE(0, 140, 255);
}

MarkerStyle MarkerStyleTable::styleFor(CornerPosition position)
{
    switch (position) {
        case CornerPosition::TopLeft:
            return MarkerStyle("TL START", RED);
        case CornerPosition::TopRight:
            return MarkerStyle("TR", GREEN);
        case CornerPosition::BottomLeft:
            return MarkerStyle("BL", BLUE);
        case CornerPosition::BottomRight:
            return MarkerStyle("BR END", ORANGE);
        default:
            return MarkerStyle("?", RED);
    }
}

MarkerStyle MarkerStyleTable::styleFor(ControlAction action)
{
    switch (action) {
        case ControlAction::RecordingStart:
            return MarkerStyle("START RECORDING", GREEN);
        case ControlAction::RecordingEnd:
            return MarkerStyle("STOP RECORDING", RED);
        default:
            return MarkerStyle("?", RED);
    }
}
