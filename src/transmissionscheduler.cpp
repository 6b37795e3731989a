#include "transmissionscheduler.h"
#include <QDateTime>
#include <QDebug>
#include <QMutexLocker>
#include <chrono>
#include <exception>

const QString TransmissionScheduler::HEADER_INSTRUCTION =
    "Header information - start recording on the receiving device";

TransmissionScheduler::TransmissionScheduler(std::shared_ptr<FrameStore> store,
                                             std::shared_ptr<const FrameRenderer> renderer,
                                             RenderSurface* surface)
    : m_store(std::move(store)),
      m_renderer(std::move(renderer)),
      m_surface(surface),
      m_running(false),
      m_skipEndMarker(false),
      m_cycleCount(0),
      m_phase(TransmissionPhase::Idle)
{
}

TransmissionScheduler::~TransmissionScheduler()
{
    abort();
}

bool TransmissionScheduler::start(std::shared_ptr<const FrameLayoutEngine> layout,
                                  const TransmissionSettings& settings,
                                  ProgressCallback progressCallback,
                                  FinishedCallback finishedCallback)
{
    if (!layout) {
        qWarning() << "TransmissionScheduler: start called without a layout";
        return false;
    }

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        qDebug() << "TransmissionScheduler: already running, ignoring start";
        return false;
    }

    QMutexLocker locker(&m_workerMutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }

    m_token = CancellationToken();
    m_skipEndMarker.store(false);
    m_cycleCount.store(1);
    m_phase.store(TransmissionPhase::Idle);

    qDebug() << "TransmissionScheduler: starting at" << settings.fps << "fps,"
             << layout->totalPages() << "pages," << cycleModeName(settings.cycleMode);

    m_worker = std::thread(&TransmissionScheduler::run, this, m_token, std::move(layout), settings,
                           std::move(progressCallback), std::move(finishedCallback));
    return true;
}

void TransmissionScheduler::stop()
{
    requestStop();
    joinWorker();
}

void TransmissionScheduler::requestStop()
{
    QMutexLocker locker(&m_workerMutex);
    m_token.cancel();
}

void TransmissionScheduler::abort()
{
    m_skipEndMarker.store(true);
    requestStop();
    joinWorker();
}

void TransmissionScheduler::wait()
{
    joinWorker();
}

void TransmissionScheduler::joinWorker()
{
    QMutexLocker locker(&m_workerMutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void TransmissionScheduler::run(CancellationToken token,
                                std::shared_ptr<const FrameLayoutEngine> layout,
                                TransmissionSettings settings,
                                ProgressCallback progressCallback,
                                FinishedCallback finishedCallback)
{
    TransmissionStateMachine machine(settings,
                                     layout->pages(QDateTime::currentSecsSinceEpoch()),
                                     layout->chunkCount());
    machine.begin();

    const auto frameInterval = std::chrono::milliseconds(settings.frameIntervalMs());

    while (true) {
        const auto tickStart = std::chrono::steady_clock::now();

        if (token.isCancelled()) {
            if (m_skipEndMarker.load()) {
                machine.abort();
            } else {
                machine.requestStop();
            }
        }
        if (machine.isFinished()) {
            break;
        }

        TransmissionStep step = machine.tick();
        display(step, machine);

        m_phase.store(machine.phase());
        m_cycleCount.store(machine.cycleCount());

        if (step.progressReported && progressCallback) {
            progressCallback(step.progress, step.progressText);
        }

        if (machine.isFinished()) {
            break;
        }

        // Never catch up on missed ticks
        const auto elapsed = std::chrono::steady_clock::now() - tickStart;
        if (elapsed < frameInterval) {
            std::this_thread::sleep_for(frameInterval - elapsed);
        }
    }

    m_phase.store(TransmissionPhase::Stopped);
    const int cycles = machine.cycleCount();
    qDebug() << "TransmissionScheduler: stopped after" << cycles << "cycle(s)";

    m_running.store(false);
    if (finishedCallback) {
        finishedCallback(cycles);
    }
}

void TransmissionScheduler::display(const TransmissionStep& step, const TransmissionStateMachine& machine)
{
    switch (step.display) {
        case TransmissionStep::Display::None:
            break;
        case TransmissionStep::Display::StartMarker:
            displayControlFrame(ControlAction::RecordingStart);
            break;
        case TransmissionStep::Display::Header:
            displayStoredFrame(FrameStore::HEADER_KEY, true);
            break;
        case TransmissionStep::Display::Page:
            displayStoredFrame(machine.page(step.pageNumber).firstChunk, false);
            break;
        case TransmissionStep::Display::EndMarker:
            displayControlFrame(ControlAction::RecordingEnd);
            break;
    }
}

void TransmissionScheduler::displayStoredFrame(int key, bool centered)
{
    cv::Mat frame;
    if (!m_store->find(key, frame)) {
        qDebug() << "TransmissionScheduler: frame" << key << "not generated yet";
        return;
    }

    m_surface->clear();
    if (centered) {
        const QPoint center = m_surface->center();
        m_surface->drawImage(frame, center, true);
        m_surface->drawText(QPoint(center.x(), center.y() + HEADER_TEXT_OFFSET),
                            HEADER_INSTRUCTION, QColor(Qt::red));
    } else {
        m_surface->drawImage(frame, QPoint(RenderSurface::PAGE_ORIGIN, RenderSurface::PAGE_ORIGIN), false);
    }
}

void TransmissionScheduler::displayControlFrame(ControlAction action)
{
    cv::Mat frame;
    try {
        frame = m_renderer->renderControlFrame(action, QDateTime::currentSecsSinceEpoch());
    } catch (const std::exception& e) {
        qWarning() << "TransmissionScheduler: control frame" << controlActionName(action)
                   << "failed:" << e.what();
        return;
    }

    m_surface->clear();
    m_surface->drawImage(frame, m_surface->center(), true);
}
