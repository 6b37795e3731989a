#ifndef RENDERSURFACE_H
#define RENDERSURFACE_H

#include <QColor>
#include <QPoint>
#include <QString>
#include <opencv2/opencv.hpp>
#include "transferdata.h"

/**
 * Number of grid cells a surface can show at once
 */
struct GridCapacity {
    int columns;
    int rows;
    int cellCount;

    GridCapacity() : columns(0), rows(0), cellCount(0) {}
    GridCapacity(int cols, int rowCount) : columns(cols), rows(rowCount), cellCount(cols * rowCount) {}

    /**
     * Cells that fit in an area when the grid is inset by margin on every side
     * @param width Area width in px
     * @param height Area height in px
     * @param cellSize Edge length of one cell in px
     * @param margin Inset kept free on the left/top and on the right/bottom
     * @return At least one column and one row
     */
    static GridCapacity fitting(int width, int height, int cellSize, int margin)
    {
        const int columns = (width - 2 * margin) / cellSize;
        const int rows = (height - 2 * margin) / cellSize;
        return GridCapacity(columns > 1 ? columns : 1, rows > 1 ? rows : 1);
    }
};

/**
 * Display target of the transmission scheduler
 * Draw calls may arrive from the scheduler thread.
 */
class RenderSurface
{
public:
    // Page frames are drawn with their top-left corner here
    static constexpr int PAGE_ORIGIN = 50;

    virtual ~RenderSurface() = default;

    virtual GridCapacity gridCapacity(DisplayMode mode) const = 0;
    virtual void clear() = 0;

    /**
     * Draw a BGR frame
     * @param image Frame to draw
     * @param position Top-left corner, or the centre when centered is true
     * @param centered Treat position as the image centre
     */
    virtual void drawImage(const cv::Mat& image, const QPoint& position, bool centered) = 0;

    virtual void drawText(const QPoint& position, const QString& text, const QColor& color) = 0;
    virtual QPoint center() const = 0;
};

#endif // RENDERSURFACE_H
