#include "framegenerator.h"
#include <QDateTime>
#include <QDebug>
#include <QMutexLocker>
#include <exception>

namespace {
// Clears the busy flag however the worker exits
class BusyFlagGuard
{
public:
    explicit BusyFlagGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~BusyFlagGuard() { m_flag.store(false); }

private:
    std::atomic<bool>& m_flag;
};
}

FrameGenerator::FrameGenerator(std::shared_ptr<FrameStore> store, std::shared_ptr<const FrameRenderer> renderer)
    : m_store(std::move(store)),
      m_renderer(std::move(renderer)),
      m_generating(false),
      m_generation(0)
{
}

FrameGenerator::~FrameGenerator()
{
    ++m_generation;
    joinWorker();
}

quint64 FrameGenerator::start(std::shared_ptr<const FrameLayoutEngine> layout,
                              ProgressCallback progressCallback,
                              CompleteCallback completeCallback,
                              FailureCallback failureCallback)
{
    bool expected = false;
    if (!m_generating.compare_exchange_strong(expected, true)) {
        qDebug() << "FrameGenerator: generation already in progress, ignoring start";
        return 0;
    }

    if (!layout) {
        m_generating.store(false);
        qWarning() << "FrameGenerator: start called without a layout";
        return 0;
    }

    QMutexLocker locker(&m_workerMutex);

    // Previous worker has already cleared the busy flag
    if (m_worker.joinable()) {
        m_worker.join();
    }

    const quint64 generation = ++m_generation;
    qDebug() << "FrameGenerator: starting generation" << generation
             << "with" << layout->totalPages() << "pages";

    m_worker = std::thread(&FrameGenerator::run, this, generation, std::move(layout),
                           std::move(progressCallback), std::move(completeCallback),
                           std::move(failureCallback));
    return generation;
}

void FrameGenerator::invalidate()
{
    ++m_generation;
    joinWorker();
    m_store->clear();
    qDebug() << "FrameGenerator: invalidated, frame store cleared";
}

void FrameGenerator::wait()
{
    joinWorker();
}

void FrameGenerator::joinWorker()
{
    QMutexLocker locker(&m_workerMutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void FrameGenerator::run(quint64 generation,
                         std::shared_ptr<const FrameLayoutEngine> layout,
                         ProgressCallback progressCallback,
                         CompleteCallback completeCallback,
                         FailureCallback failureCallback)
{
    BusyFlagGuard guard(m_generating);

    const int totalPages = layout->totalPages();
    const int totalUnits = totalPages + 1;
    int completedUnits = 0;

    auto reportProgress = [&](const QString& phase) {
        ++completedUnits;
        if (progressCallback) {
            progressCallback(static_cast<double>(completedUnits) / totalUnits, phase);
        }
    };

    bool finished = false;

    try {
        cv::Mat headerFrame = m_renderer->renderHeaderFrame(layout->header());
        if (!isCurrent(generation)) {
            qDebug() << "FrameGenerator: generation" << generation << "superseded";
            return;
        }
        m_store->insert(FrameStore::HEADER_KEY, headerFrame);
        reportProgress(QString("Header frame generated"));

        const qint64 timestamp = QDateTime::currentSecsSinceEpoch();
        for (int pageNumber = 1; pageNumber <= totalPages; ++pageNumber) {
            Page page = layout->page(pageNumber, timestamp);
            cv::Mat frame = m_renderer->renderPageFrame(layout->layoutPage(page));

            if (!isCurrent(generation)) {
                qDebug() << "FrameGenerator: generation" << generation << "superseded at page" << pageNumber;
                return;
            }
            m_store->insert(page.firstChunk, frame);
            reportProgress(QString("Page %1/%2 generated").arg(pageNumber).arg(totalPages));
        }

        finished = true;
    } catch (const std::exception& e) {
        QString message = QString("Frame generation failed: %1").arg(e.what());
        qWarning() << "FrameGenerator:" << message;
        if (failureCallback) {
            failureCallback(message);
        }
    }

    if (finished) {
        qDebug() << "FrameGenerator: generation" << generation << "complete," << totalUnits << "frames";
        if (completeCallback) {
            completeCallback();
        }
    }
}
