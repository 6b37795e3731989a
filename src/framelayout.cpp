#include "framelayout.h"
#include <QDebug>
#include <QString>
#include <algorithm>
#include <limits>

GridFloor GridFloor::forMode(MarkerMode mode)
{
    if (mode == MarkerMode::FourCorner) {
        return GridFloor(5, 4);
    }
    return GridFloor(2, 2);
}

GridConfig GridConfig::resolve(int requestedColumns, int requestedRows, MarkerMode mode,
                               const GridFloor& floor)
{
    int columns = std::max(requestedColumns, floor.minColumns);
    int rows = std::max(requestedRows, floor.minRows);

    if (columns < 1 || rows < 1) {
        throw LayoutConfigurationError(
            QString("Invalid grid %1x%2").arg(columns).arg(rows).toStdString());
    }
    if (columns > std::numeric_limits<int>::max() / rows) {
        throw LayoutConfigurationError(
            QString("Grid %1x%2 is too large").arg(columns).arg(rows).toStdString());
    }

    GridConfig grid(columns, rows, mode);

    // Corner markers must land on distinct cells
    bool cornersOverlap = (mode == MarkerMode::FourCorner) ? (columns < 2 || rows < 2)
                                                            : (columns * rows < 2);
    if (cornersOverlap || grid.dataCapacity() < 1) {
        throw LayoutConfigurationError(
            QString("Grid %1x%2 leaves no room for data with %3 markers")
                .arg(columns).arg(rows).arg(grid.markerCount()).toStdString());
    }

    qDebug() << "FrameLayout: grid" << columns << "x" << rows
             << "requested" << requestedColumns << "x" << requestedRows
             << "capacity" << grid.dataCapacity();
    return grid;
}

GridConfig GridConfig::resolve(int requestedColumns, int requestedRows, MarkerMode mode)
{
    return resolve(requestedColumns, requestedRows, mode, GridFloor::forMode(mode));
}

FrameLayoutEngine::FrameLayoutEngine(std::shared_ptr<const TransferData> data, const GridConfig& grid)
    : m_data(std::move(data)),
      m_grid(grid),
      m_totalPages(0)
{
    if (!m_data) {
        throw std::invalid_argument("FrameLayoutEngine requires transfer data");
    }
    if (m_grid.dataCapacity() < 1) {
        throw LayoutConfigurationError("Grid has no data capacity");
    }

    m_totalPages = pageCount(m_data->chunkCount(), m_grid.dataCapacity());
    m_header = m_data->header;
    m_header.totalPages = m_totalPages;
}

int FrameLayoutEngine::pageCount(int chunkCount, int dataCapacity)
{
    if (chunkCount <= 0 || dataCapacity <= 0) {
        return 0;
    }
    return (chunkCount + dataCapacity - 1) / dataCapacity;
}

Page FrameLayoutEngine::page(int pageNumber, qint64 timestamp) const
{
    if (pageNumber < 1 || pageNumber > m_totalPages) {
        throw std::out_of_range(QString("Page %1 out of range 1..%2")
                                    .arg(pageNumber).arg(m_totalPages).toStdString());
    }

    Page result;
    result.pageNumber = pageNumber;
    result.firstChunk = (pageNumber - 1) * m_grid.dataCapacity();
    result.endChunk = std::min(result.firstChunk + m_grid.dataCapacity(), chunkCount());

    for (CornerPosition position : markerPositions(m_grid.markerMode)) {
        result.markers.emplace_back(position, pageNumber, m_totalPages, timestamp);
    }

    return result;
}

std::vector<Page> FrameLayoutEngine::pages(qint64 timestamp) const
{
    std::vector<Page> result;
    result.reserve(static_cast<size_t>(m_totalPages));
    for (int pageNumber = 1; pageNumber <= m_totalPages; ++pageNumber) {
        result.push_back(page(pageNumber, timestamp));
    }
    return result;
}

PageLayout FrameLayoutEngine::layoutPage(const Page& page) const
{
    PageLayout layout;
    layout.page = page;
    layout.columns = m_grid.columns;
    layout.rows = m_grid.rows;
    layout.cells.reserve(static_cast<size_t>(m_grid.cellCount()));

    int nextChunk = page.firstChunk;

    for (int row = 0; row < m_grid.rows; ++row) {
        for (int column = 0; column < m_grid.columns; ++column) {
            GridCell cell;
            cell.row = row;
            cell.column = column;

            CornerPosition position;
            if (markerAt(m_grid, row, column, position)) {
                cell.kind = GridCell::Kind::Marker;
                for (size_t i = 0; i < layout.page.markers.size(); ++i) {
                    if (layout.page.markers[i].position == position) {
                        cell.markerIndex = static_cast<int>(i);
                        break;
                    }
                }
            } else if (nextChunk < page.endChunk) {
                cell.kind = GridCell::Kind::Chunk;
                cell.chunk = &m_data->chunks[static_cast<size_t>(nextChunk)];
                ++nextChunk;
            } else {
                cell.kind = GridCell::Kind::Empty;
            }

            layout.cells.push_back(cell);
        }
    }

    return layout;
}

std::vector<CornerPosition> FrameLayoutEngine::markerPositions(MarkerMode mode)
{
    if (mode == MarkerMode::FourCorner) {
        return {CornerPosition::TopLeft, CornerPosition::TopRight,
                CornerPosition::BottomLeft, CornerPosition::BottomRight};
    }
    return {CornerPosition::TopLeft, CornerPosition::BottomRight};
}

bool FrameLayoutEngine::markerAt(const GridConfig& grid, int row, int column, CornerPosition& position)
{
    const int lastRow = grid.rows - 1;
    const int lastColumn = grid.columns - 1;

    if (row == 0 && column == 0) {
        position = CornerPosition::TopLeft;
        return true;
    }
    if (row == lastRow && column == lastColumn) {
        position = CornerPosition::BottomRight;
        return true;
    }
    if (grid.markerMode == MarkerMode::FourCorner) {
        if (row == 0 && column == lastColumn) {
            position = CornerPosition::TopRight;
            return true;
        }
        if (row == lastRow && column == 0) {
            position = CornerPosition::BottomLeft;
            return true;
        }
    }
    return false;
}
