#ifndef TRANSMISSIONSTATE_H
#define TRANSMISSIONSTATE_H

#include <QString>
#include <vector>
#include "transferdata.h"

enum class TransmissionPhase {
    Idle,
    StartMarker,
    Header,
    Page,
    EndMarker,
    Stopped
};

QString transmissionPhaseName(TransmissionPhase phase);

/**
 * Playback parameters of one transmission session
 */
struct TransmissionSettings {
    int fps;
    int headerSeconds;
    int pageSeconds;
    int controlSeconds;
    CycleMode cycleMode;
    bool startMarker;   // Show the begin capture frame before the first header
    bool endMarker;     // Show the stop capture frame before stopping

    TransmissionSettings() :
        fps(5),
        headerSeconds(3),
        pageSeconds(1),
        controlSeconds(2),
        cycleMode(CycleMode::Continuous),
        startMarker(true),
        endMarker(true)
    {}

    int headerDwellTicks() const { return dwellTicks(headerSeconds); }
    int pageDwellTicks() const { return dwellTicks(pageSeconds); }
    int controlDwellTicks() const { return dwellTicks(controlSeconds); }

    /**
     * Tick interval in milliseconds (1000 / fps)
     */
    int frameIntervalMs() const { return fps > 0 ? 1000 / fps : 1000; }

private:
    int dwellTicks(int seconds) const {
        int ticks = fps * seconds;
        return ticks < 1 ? 1 : ticks;
    }
};

/**
 * What a single tick asks the display to do
 */
struct TransmissionStep {
    enum class Display {
        None,           // Keep the current frame on screen
        StartMarker,
        Header,
        Page,
        EndMarker
    };

    Display display;
    int pageNumber;             // 1-based, valid when display == Page
    bool progressReported;      // A page dwell expired on this tick
    double progress;            // Percent of pages shown in this cycle
    QString progressText;

    TransmissionStep() : display(Display::None), pageNumber(0), progressReported(false), progress(0.0) {}
};

/**
 * Tick-driven state machine behind the transmission scheduler
 *
 * IDLE -> START_MARKER -> HEADER -> PAGE(1..N) -> HEADER (continuous)
 *                                              -> END_MARKER -> STOPPED
 *
 * A frame is displayed on the first tick of its state and held for the
 * state's dwell. No clock is involved, the scheduler supplies the ticks.
 */
class TransmissionStateMachine
{
public:
    TransmissionStateMachine(const TransmissionSettings& settings, std::vector<Page> pages, int chunkCount);

    /**
     * Reset all counters and enter the first state
     */
    void begin();

    /**
     * Advance by one tick
     * @return Display command and progress report for this tick
     */
    TransmissionStep tick();

    /**
     * External stop: go to END_MARKER when configured, otherwise STOPPED
     */
    void requestStop();

    /**
     * Stop at once, skipping the end marker
     */
    void abort();

    TransmissionPhase phase() const { return m_phase; }
    int currentPage() const { return m_currentPage; }
    int cycleCount() const { return m_cycleCount; }
    int ticksInPhase() const { return m_ticksInPhase; }
    int totalPages() const { return static_cast<int>(m_pages.size()); }
    bool isFinished() const { return m_phase == TransmissionPhase::Stopped; }
    const TransmissionSettings& settings() const { return m_settings; }

    /**
     * @param pageNumber 1-based page number
     */
    const Page& page(int pageNumber) const { return m_pages.at(static_cast<size_t>(pageNumber - 1)); }

private:
    void enter(TransmissionPhase phase);
    void advance(TransmissionStep& step);
    void finish();
    int dwellFor(TransmissionPhase phase) const;
    QString progressText(const Page& page) const;

    TransmissionSettings m_settings;
    std::vector<Page> m_pages;
    int m_chunkCount;

    TransmissionPhase m_phase;
    int m_currentPage;
    int m_cycleCount;
    int m_ticksInPhase;
};

#endif // TRANSMISSIONSTATE_H
