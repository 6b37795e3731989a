#include "transferdata.h"

QString cornerPositionName(CornerPosition position)
{
    switch (position) {
        case CornerPosition::TopLeft:
            return "top-left";
        case CornerPosition::TopRight:
            return "top-right";
        case CornerPosition::BottomLeft:
            return "bottom-left";
        case CornerPosition::BottomRight:
            return "bottom-right";
        default:
            return "top-left";
    }
}

QString controlActionName(ControlAction action)
{
    switch (action) {
        case ControlAction::RecordingStart:
            return "recording_start";
        case ControlAction::RecordingEnd:
            return "recording_end";
        default:
            return "recording_start";
    }
}

QString displayModeName(DisplayMode mode)
{
    return mode == DisplayMode::Photo ? "Photo" : "Video";
}

DisplayMode displayModeFromName(const QString& name)
{
    if (name == "Photo") {
        return DisplayMode::Photo;
    }
    return DisplayMode::Video;
}

QString cycleModeName(CycleMode mode)
{
    return mode == CycleMode::Single ? "Single" : "Continuous";
}

CycleMode cycleModeFromName(const QString& name)
{
    if (name == "Single") {
        return CycleMode::Single;
    }
    return CycleMode::Continuous;
}
