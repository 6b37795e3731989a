#include <gtest/gtest.h>
#include <memory>
#include <set>
#include "framelayout.h"

namespace {

std::shared_ptr<const TransferData> makeTransfer(int chunkCount)
{
    auto data = std::make_shared<TransferData>();
    for (int i = 0; i < chunkCount; ++i) {
        data->chunks.emplace_back(i, QString("chunk-%1").arg(i));
    }
    data->header.fileName = "sample.bin";
    data->header.totalChunks = chunkCount;
    return data;
}

int countKind(const PageLayout& layout, GridCell::Kind kind)
{
    int count = 0;
    for (const GridCell& cell : layout.cells) {
        if (cell.kind == kind) {
            ++count;
        }
    }
    return count;
}

}

TEST(GridConfigTest, CapacitySubtractsMarkers)
{
    EXPECT_EQ(GridConfig(5, 4, MarkerMode::FourCorner).dataCapacity(), 16);
    EXPECT_EQ(GridConfig(5, 4, MarkerMode::TwoCorner).dataCapacity(), 18);
    EXPECT_EQ(GridConfig(3, 3, MarkerMode::TwoCorner).markerCount(), 2);
}

TEST(GridConfigTest, FourCornerFloorIsApplied)
{
    GridConfig grid = GridConfig::resolve(2, 1, MarkerMode::FourCorner);
    EXPECT_EQ(grid.columns, 5);
    EXPECT_EQ(grid.rows, 4);
    EXPECT_EQ(grid.dataCapacity(), 16);
}

TEST(GridConfigTest, FloorAppliesPerAxis)
{
    GridConfig grid = GridConfig::resolve(7, 2, MarkerMode::FourCorner);
    EXPECT_EQ(grid.columns, 7);
    EXPECT_EQ(grid.rows, 4);
}

TEST(GridConfigTest, LargerRequestIsKept)
{
    GridConfig grid = GridConfig::resolve(8, 6, MarkerMode::TwoCorner);
    EXPECT_EQ(grid.columns, 8);
    EXPECT_EQ(grid.rows, 6);
    EXPECT_EQ(grid.dataCapacity(), 46);
}

TEST(GridConfigTest, TwoCornerFloorLeavesRoomForData)
{
    GridConfig grid = GridConfig::resolve(0, 0, MarkerMode::TwoCorner);
    EXPECT_EQ(grid.columns, 2);
    EXPECT_EQ(grid.rows, 2);
    EXPECT_EQ(grid.dataCapacity(), 2);
}

TEST(GridConfigTest, UnusableGridThrows)
{
    // A 1x1 floor cannot hold two markers and a data cell
    EXPECT_THROW(GridConfig::resolve(1, 1, MarkerMode::TwoCorner, GridFloor(1, 1)),
                 LayoutConfigurationError);
    // Four corners need at least two columns and two rows
    EXPECT_THROW(GridConfig::resolve(6, 1, MarkerMode::FourCorner, GridFloor(1, 1)),
                 LayoutConfigurationError);
    EXPECT_THROW(GridConfig::resolve(2, 2, MarkerMode::FourCorner, GridFloor(2, 2)),
                 LayoutConfigurationError);
}

TEST(FrameLayoutEngineTest, PageCountIsCeiling)
{
    EXPECT_EQ(FrameLayoutEngine::pageCount(0, 16), 0);
    EXPECT_EQ(FrameLayoutEngine::pageCount(1, 16), 1);
    EXPECT_EQ(FrameLayoutEngine::pageCount(16, 16), 1);
    EXPECT_EQ(FrameLayoutEngine::pageCount(17, 16), 2);
    EXPECT_EQ(FrameLayoutEngine::pageCount(100, 7), 15);

    for (int chunks = 0; chunks < 60; ++chunks) {
        FrameLayoutEngine engine(makeTransfer(chunks), GridConfig(5, 4, MarkerMode::FourCorner));
        EXPECT_EQ(engine.totalPages(), (chunks + 15) / 16);
    }
}

TEST(FrameLayoutEngineTest, ZeroChunksIsHeaderOnly)
{
    FrameLayoutEngine engine(makeTransfer(0), GridConfig(5, 4, MarkerMode::FourCorner));
    EXPECT_EQ(engine.totalPages(), 0);
    EXPECT_TRUE(engine.pages(0).empty());
    EXPECT_EQ(engine.header().totalPages, 0);
}

TEST(FrameLayoutEngineTest, HeaderGetsTotalPages)
{
    FrameLayoutEngine engine(makeTransfer(40), GridConfig(5, 4, MarkerMode::FourCorner));
    EXPECT_EQ(engine.header().totalPages, 3);
    EXPECT_EQ(engine.header().fileName, QString("sample.bin"));
}

TEST(FrameLayoutEngineTest, FourCornerTwentyChunksSplitAcrossTwoPages)
{
    FrameLayoutEngine engine(makeTransfer(20), GridConfig(5, 4, MarkerMode::FourCorner));
    ASSERT_EQ(engine.dataCapacity(), 16);

    std::vector<Page> pages = engine.pages(1700000000);
    ASSERT_EQ(pages.size(), 2u);

    EXPECT_EQ(pages[0].firstChunk, 0);
    EXPECT_EQ(pages[0].endChunk, 16);
    EXPECT_EQ(pages[1].firstChunk, 16);
    EXPECT_EQ(pages[1].endChunk, 20);

    PageLayout first = engine.layoutPage(pages[0]);
    EXPECT_EQ(countKind(first, GridCell::Kind::Marker), 4);
    EXPECT_EQ(countKind(first, GridCell::Kind::Chunk), 16);
    EXPECT_EQ(countKind(first, GridCell::Kind::Empty), 0);

    PageLayout second = engine.layoutPage(pages[1]);
    EXPECT_EQ(countKind(second, GridCell::Kind::Marker), 4);
    EXPECT_EQ(countKind(second, GridCell::Kind::Chunk), 4);
    EXPECT_EQ(countKind(second, GridCell::Kind::Empty), 12);

    std::vector<int> carried;
    for (const GridCell& cell : second.cells) {
        if (cell.kind == GridCell::Kind::Chunk) {
            ASSERT_NE(cell.chunk, nullptr);
            carried.push_back(cell.chunk->index);
        } else {
            EXPECT_EQ(cell.chunk, nullptr);
        }
    }
    EXPECT_EQ(carried, (std::vector<int>{16, 17, 18, 19}));
}

TEST(FrameLayoutEngineTest, FourCornerMarkersSitInCorners)
{
    FrameLayoutEngine engine(makeTransfer(5), GridConfig(5, 4, MarkerMode::FourCorner));
    PageLayout layout = engine.layoutPage(engine.page(1, 0));

    auto positionAt = [&](int row, int column) {
        const GridCell& cell = layout.cellAt(row, column);
        EXPECT_EQ(cell.kind, GridCell::Kind::Marker);
        return layout.page.markers.at(static_cast<size_t>(cell.markerIndex)).position;
    };

    EXPECT_EQ(positionAt(0, 0), CornerPosition::TopLeft);
    EXPECT_EQ(positionAt(0, 4), CornerPosition::TopRight);
    EXPECT_EQ(positionAt(3, 0), CornerPosition::BottomLeft);
    EXPECT_EQ(positionAt(3, 4), CornerPosition::BottomRight);
}

TEST(FrameLayoutEngineTest, TwoCornerUsesTopLeftAndBottomRight)
{
    FrameLayoutEngine engine(makeTransfer(30), GridConfig(4, 3, MarkerMode::TwoCorner));
    ASSERT_EQ(engine.dataCapacity(), 10);

    PageLayout layout = engine.layoutPage(engine.page(1, 0));
    ASSERT_EQ(layout.page.markers.size(), 2u);

    EXPECT_EQ(layout.cellAt(0, 0).kind, GridCell::Kind::Marker);
    EXPECT_EQ(layout.cellAt(2, 3).kind, GridCell::Kind::Marker);
    EXPECT_EQ(layout.cellAt(0, 3).kind, GridCell::Kind::Chunk);
    EXPECT_EQ(layout.cellAt(2, 0).kind, GridCell::Kind::Chunk);

    // Row-major fill: first data cell is (0,1)
    EXPECT_EQ(layout.cellAt(0, 1).chunk->index, 0);
    EXPECT_EQ(layout.cellAt(1, 0).chunk->index, 3);
    EXPECT_EQ(layout.cellAt(2, 2).chunk->index, 9);
}

TEST(FrameLayoutEngineTest, MarkersCarryTheirOwnPageNumber)
{
    FrameLayoutEngine engine(makeTransfer(50), GridConfig(5, 4, MarkerMode::FourCorner));
    std::vector<Page> pages = engine.pages(1234);
    ASSERT_EQ(pages.size(), 4u);

    for (const Page& page : pages) {
        ASSERT_EQ(page.markers.size(), 4u);
        std::set<CornerPosition> positions;
        for (const CornerMarker& marker : page.markers) {
            EXPECT_EQ(marker.page, page.pageNumber);
            EXPECT_EQ(marker.total, 4);
            EXPECT_EQ(marker.timestamp, 1234);
            positions.insert(marker.position);
        }
        EXPECT_EQ(positions.size(), 4u);
    }
}

TEST(FrameLayoutEngineTest, ChunksAreReferencedNotCopied)
{
    std::shared_ptr<const TransferData> data = makeTransfer(8);
    FrameLayoutEngine engine(data, GridConfig(3, 3, MarkerMode::TwoCorner));

    PageLayout layout = engine.layoutPage(engine.page(1, 0));
    for (const GridCell& cell : layout.cells) {
        if (cell.kind == GridCell::Kind::Chunk) {
            EXPECT_EQ(cell.chunk, &data->chunks[static_cast<size_t>(cell.chunk->index)]);
        }
    }
}

TEST(FrameLayoutEngineTest, EveryChunkAppearsExactlyOnce)
{
    FrameLayoutEngine engine(makeTransfer(77), GridConfig(6, 5, MarkerMode::FourCorner));

    std::vector<int> seen;
    for (const Page& page : engine.pages(0)) {
        PageLayout layout = engine.layoutPage(page);
        for (const GridCell& cell : layout.cells) {
            if (cell.kind == GridCell::Kind::Chunk) {
                seen.push_back(cell.chunk->index);
            }
        }
    }

    ASSERT_EQ(seen.size(), 77u);
    for (int i = 0; i < 77; ++i) {
        EXPECT_EQ(seen[static_cast<size_t>(i)], i);
    }
}

TEST(FrameLayoutEngineTest, PageOutOfRangeThrows)
{
    FrameLayoutEngine engine(makeTransfer(10), GridConfig(5, 4, MarkerMode::FourCorner));
    EXPECT_THROW(engine.page(0, 0), std::out_of_range);
    EXPECT_THROW(engine.page(2, 0), std::out_of_range);
}
