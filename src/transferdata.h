#ifndef TRANSFERDATA_H
#define TRANSFERDATA_H

#include <QString>
#include <QtGlobal>
#include <vector>

/**
 * Number of synchronization markers placed on every page frame
 */
enum class MarkerMode {
    TwoCorner,   // Video layout: top-left start marker, bottom-right end marker
    FourCorner   // Photo layout: one marker in every corner
};

/**
 * Display mode chosen by the user; selects the marker mode of the layout
 */
enum class DisplayMode {
    Video,
    Photo
};

/**
 * Playback policy of the transmission scheduler
 */
enum class CycleMode {
    Single,      // Stop after the last page of the first cycle
    Continuous   // Loop back to the header until cancelled
};

/**
 * Logical position of a corner marker on the grid
 */
enum class CornerPosition {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight
};

/**
 * Start/end of capture cue shown as a single enlarged control frame
 */
enum class ControlAction {
    RecordingStart,
    RecordingEnd
};

/**
 * Header record describing a whole transfer
 * Transmitted first so that the receiver can size its reassembly buffers
 */
struct TransferHeader {
    QString fileName;           // e.g. "report.pdf"
    QString fileType;           // Suffix including the dot, e.g. ".pdf" (empty if none)
    qint64 originalSize;        // Size of the raw file in bytes
    qint64 compressedSize;      // Size after compression, before text encoding
    QString compressionType;    // "zstd" or "gzip"
    int chunkSize;              // Characters per chunk (last chunk may be shorter)
    int totalChunks;
    int totalPages;             // Filled in once the grid is known
    qint64 timestamp;           // Seconds since epoch at creation

    TransferHeader() :
        originalSize(0),
        compressedSize(0),
        chunkSize(0),
        totalChunks(0),
        totalPages(0),
        timestamp(0)
    {}
};

/**
 * One fixed-size slice of the Base64 encoded, compressed payload
 */
struct DataChunk {
    int index;
    QString data;

    DataChunk() : index(0) {}
    DataChunk(int chunkIndex, const QString& chunkData) : index(chunkIndex), data(chunkData) {}
};

/**
 * Result of loading a file: header plus the ordered chunks
 * Concatenating chunk data in index order reproduces the encoded stream
 */
struct TransferData {
    TransferHeader header;
    std::vector<DataChunk> chunks;

    int chunkCount() const { return static_cast<int>(chunks.size()); }
};

/**
 * Synchronization payload placed at a reserved grid cell
 */
struct CornerMarker {
    CornerPosition position;
    int page;
    int total;
    qint64 timestamp;

    CornerMarker() : position(CornerPosition::TopLeft), page(0), total(0), timestamp(0) {}
    CornerMarker(CornerPosition pos, int pageNumber, int totalPages, qint64 ts) :
        position(pos), page(pageNumber), total(totalPages), timestamp(ts) {}
};

/**
 * Unit of transmission: one page frame
 * Carries the half-open chunk range [firstChunk, endChunk)
 */
struct Page {
    int pageNumber;     // 1-based
    int firstChunk;     // Also the frame store key of this page
    int endChunk;
    std::vector<CornerMarker> markers;

    Page() : pageNumber(0), firstChunk(0), endChunk(0) {}

    int chunkCount() const { return endChunk - firstChunk; }
};

/**
 * Content of a single grid cell after page assembly
 */
struct GridCell {
    enum class Kind {
        Marker,
        Chunk,
        Empty
    };

    Kind kind;
    int row;
    int column;
    int markerIndex;            // Index into Page::markers when kind == Marker
    const DataChunk* chunk;     // Points into TransferData::chunks when kind == Chunk

    GridCell() : kind(Kind::Empty), row(0), column(0), markerIndex(-1), chunk(nullptr) {}
};

/**
 * Fully assembled page: every cell of the grid in row-major order
 */
struct PageLayout {
    Page page;
    int columns;
    int rows;
    std::vector<GridCell> cells;

    PageLayout() : columns(0), rows(0) {}

    const GridCell& cellAt(int row, int column) const {
        return cells[static_cast<size_t>(row * columns + column)];
    }
};

/**
 * Wire names used inside the QR payloads and the settings file
 */
QString cornerPositionName(CornerPosition position);
QString controlActionName(ControlAction action);
QString displayModeName(DisplayMode mode);
DisplayMode displayModeFromName(const QString& name);
QString cycleModeName(CycleMode mode);
CycleMode cycleModeFromName(const QString& name);

#endif // TRANSFERDATA_H
