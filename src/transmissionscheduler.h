#ifndef TRANSMISSIONSCHEDULER_H
#define TRANSMISSIONSCHEDULER_H

#include <QMutex>
#include <QString>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include "cancellationtoken.h"
#include "framelayout.h"
#include "framerenderer.h"
#include "framestore.h"
#include "rendersurface.h"
#include "transmissionstate.h"

/**
 * Timer loop that plays a transfer's frames onto a render surface
 *
 * Drives a TransmissionStateMachine at the configured frame rate on its own
 * thread. Frames are read from the frame store as published by the
 * generator; a frame that is not there yet is simply skipped for that tick.
 * Control frames are rendered on demand since they carry the current time.
 */
class TransmissionScheduler
{
public:
    /**
     * Progress callback function type
     * Parameters: percent of pages shown in this cycle, progress text
     */
    using ProgressCallback = std::function<void(double, const QString&)>;

    /**
     * Finished callback function type, invoked from the scheduler thread
     * Parameters: cycles started during the session
     */
    using FinishedCallback = std::function<void(int)>;

    TransmissionScheduler(std::shared_ptr<FrameStore> store,
                          std::shared_ptr<const FrameRenderer> renderer,
                          RenderSurface* surface);
    ~TransmissionScheduler();

    TransmissionScheduler(const TransmissionScheduler&) = delete;
    TransmissionScheduler& operator=(const TransmissionScheduler&) = delete;

    /**
     * Start a session; does nothing if one is already running
     * @param layout Layout of the transfer being shown
     * @param settings Frame rate, dwell and cycle policy
     * @param progressCallback Page progress notification
     * @param finishedCallback Session end notification
     * @return true if a new session was started
     */
    bool start(std::shared_ptr<const FrameLayoutEngine> layout,
               const TransmissionSettings& settings,
               ProgressCallback progressCallback = nullptr,
               FinishedCallback finishedCallback = nullptr);

    /**
     * Request a graceful stop and wait for the loop to exit
     * The end marker is still shown when configured.
     */
    void stop();

    /**
     * Request a stop without waiting
     */
    void requestStop();

    /**
     * Stop without playing the end marker and wait for the loop to exit
     * Used when the surface is going away.
     */
    void abort();

    /**
     * Wait for the current session to end on its own
     */
    void wait();

    bool isRunning() const { return m_running.load(); }
    int cycleCount() const { return m_cycleCount.load(); }
    TransmissionPhase phase() const { return m_phase.load(); }

private:
    void run(CancellationToken token,
             std::shared_ptr<const FrameLayoutEngine> layout,
             TransmissionSettings settings,
             ProgressCallback progressCallback,
             FinishedCallback finishedCallback);

    void display(const TransmissionStep& step, const TransmissionStateMachine& machine);
    void displayStoredFrame(int key, bool centered);
    void displayControlFrame(ControlAction action);
    void joinWorker();

    std::shared_ptr<FrameStore> m_store;
    std::shared_ptr<const FrameRenderer> m_renderer;
    RenderSurface* m_surface;

    std::thread m_worker;
    QMutex m_workerMutex;
    CancellationToken m_token;

    std::atomic<bool> m_running;
    std::atomic<bool> m_skipEndMarker;
    std::atomic<int> m_cycleCount;
    std::atomic<TransmissionPhase> m_phase;

    static const QString HEADER_INSTRUCTION;
    static constexpr int HEADER_TEXT_OFFSET = 320;
};

#endif // TRANSMISSIONSCHEDULER_H
