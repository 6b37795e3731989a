#ifndef FRAMELAYOUT_H
#define FRAMELAYOUT_H

#include <memory>
#include <stdexcept>
#include <vector>
#include "transferdata.h"

/**
 * Thrown when no usable grid exists even after applying the minimum floor
 */
class LayoutConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Smallest grid accepted for a marker mode
 */
struct GridFloor {
    int minColumns;
    int minRows;

    GridFloor(int columns, int rows) : minColumns(columns), minRows(rows) {}

    /**
     * Default floor: 5x4 for four-corner layouts, 2x2 for two-corner layouts
     */
    static GridFloor forMode(MarkerMode mode);
};

/**
 * Grid used for every page of one transfer
 * Computed once per transfer and held fixed afterwards
 */
struct GridConfig {
    int columns;
    int rows;
    MarkerMode markerMode;

    GridConfig() : columns(0), rows(0), markerMode(MarkerMode::TwoCorner) {}
    GridConfig(int cols, int rowCount, MarkerMode mode) : columns(cols), rows(rowCount), markerMode(mode) {}

    int cellCount() const { return columns * rows; }
    int markerCount() const { return markerCountFor(markerMode); }
    int dataCapacity() const { return cellCount() - markerCount(); }

    static int markerCountFor(MarkerMode mode) { return mode == MarkerMode::FourCorner ? 4 : 2; }

    /**
     * Apply the minimum floor to a requested grid, then validate it
     * The floor is applied before marker cells are subtracted.
     * @param requestedColumns Columns reported by the render surface
     * @param requestedRows Rows reported by the render surface
     * @param mode Marker mode
     * @param floor Minimum grid size
     * @return Usable grid configuration
     * @throws LayoutConfigurationError if the floored grid holds no data cell
     */
    static GridConfig resolve(int requestedColumns, int requestedRows, MarkerMode mode,
                              const GridFloor& floor);
    static GridConfig resolve(int requestedColumns, int requestedRows, MarkerMode mode);
};

/**
 * Assigns chunks and corner markers to grid cells, one page per frame
 *
 * Chunks are referenced from the shared TransferData, never copied.
 * Marker payloads are rebuilt for every page with that page's number.
 */
class FrameLayoutEngine
{
public:
    FrameLayoutEngine(std::shared_ptr<const TransferData> data, const GridConfig& grid);

    const GridConfig& grid() const { return m_grid; }
    const TransferData& data() const { return *m_data; }

    int chunkCount() const { return m_data->chunkCount(); }
    int dataCapacity() const { return m_grid.dataCapacity(); }
    int totalPages() const { return m_totalPages; }

    /**
     * Header with totalPages filled in for this grid
     */
    const TransferHeader& header() const { return m_header; }

    /**
     * ceil(chunkCount / dataCapacity); zero chunks give zero pages
     */
    static int pageCount(int chunkCount, int dataCapacity);

    /**
     * Build one page (1-based) with freshly stamped markers
     * @param pageNumber Page number in [1, totalPages()]
     * @param timestamp Marker timestamp (seconds since epoch)
     */
    Page page(int pageNumber, qint64 timestamp) const;

    /**
     * Build all pages in ascending order
     */
    std::vector<Page> pages(qint64 timestamp) const;

    /**
     * Place markers and chunks on the grid in row-major order
     * Non-marker cells past the page's last chunk are explicitly empty.
     */
    PageLayout layoutPage(const Page& page) const;

    /**
     * Reserved marker positions for a mode, in row-major order
     */
    static std::vector<CornerPosition> markerPositions(MarkerMode mode);

    /**
     * Check whether a cell is reserved for a marker
     * @param grid Grid configuration
     * @param row Cell row
     * @param column Cell column
     * @param position Set to the marker position when reserved
     * @return true if the cell holds a marker
     */
    static bool markerAt(const GridConfig& grid, int row, int column, CornerPosition& position);

private:
    std::shared_ptr<const TransferData> m_data;
    GridConfig m_grid;
    int m_totalPages;
    TransferHeader m_header;
};

#endif // FRAMELAYOUT_H
