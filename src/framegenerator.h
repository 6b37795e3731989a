#ifndef FRAMEGENERATOR_H
#define FRAMEGENERATOR_H

#include <QMutex>
#include <QString>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include "framelayout.h"
#include "framerenderer.h"
#include "framestore.h"

/**
 * Renders the header and every page of a transfer on a background thread
 *
 * Each start() returns a generation token. Loading a new file calls
 * invalidate(), which bumps the token so that a stale worker stops before
 * its next store, waits for it, and clears the frame store.
 *
 * Callbacks are invoked on the worker thread.
 */
class FrameGenerator
{
public:
    /**
     * Progress callback function type
     * Parameters: completed fraction in [0, 1], phase description
     */
    using ProgressCallback = std::function<void(double, const QString&)>;

    /**
     * Invoked exactly once when every frame has been stored
     */
    using CompleteCallback = std::function<void()>;

    /**
     * Invoked when a frame fails to render; frames stored so far remain
     */
    using FailureCallback = std::function<void(const QString&)>;

    FrameGenerator(std::shared_ptr<FrameStore> store, std::shared_ptr<const FrameRenderer> renderer);
    ~FrameGenerator();

    FrameGenerator(const FrameGenerator&) = delete;
    FrameGenerator& operator=(const FrameGenerator&) = delete;

    /**
     * Begin generating all frames of a transfer
     * A call while a generation is running does nothing.
     * @param layout Layout of the transfer to render
     * @param progressCallback Per-unit progress
     * @param completeCallback Completion notification
     * @param failureCallback Render failure notification
     * @return Generation token, 0 if a generation was already running
     */
    quint64 start(std::shared_ptr<const FrameLayoutEngine> layout,
                  ProgressCallback progressCallback,
                  CompleteCallback completeCallback,
                  FailureCallback failureCallback = nullptr);

    /**
     * Discard the running generation and every stored frame
     * Blocks until the worker has exited.
     */
    void invalidate();

    /**
     * Wait for the current worker to finish
     */
    void wait();

    bool isGenerating() const { return m_generating.load(); }
    quint64 currentGeneration() const { return m_generation.load(); }
    bool isCurrent(quint64 generation) const { return generation == m_generation.load(); }

    std::shared_ptr<FrameStore> store() const { return m_store; }

private:
    void run(quint64 generation,
             std::shared_ptr<const FrameLayoutEngine> layout,
             ProgressCallback progressCallback,
             CompleteCallback completeCallback,
             FailureCallback failureCallback);

    void joinWorker();

    std::shared_ptr<FrameStore> m_store;
    std::shared_ptr<const FrameRenderer> m_renderer;

    std::thread m_worker;
    QMutex m_workerMutex;

    std::atomic<bool> m_generating;
    std::atomic<quint64> m_generation;
};

#endif // FRAMEGENERATOR_H
