#ifndef TESTFAKES_H
#define TESTFAKES_H

#include <QElapsedTimer>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "framerenderer.h"
#include "qrrasterizer.h"
#include "rendersurface.h"

/**
 * Poll a condition until it holds or the timeout expires
 */
inline bool waitFor(const std::function<bool()>& condition, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!condition()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

/**
 * Renderer producing small solid frames without libqrencode
 * Page frames encode the page number in their pixel value.
 */
class FakeRenderer : public FrameRenderer
{
public:
    cv::Mat renderHeaderFrame(const TransferHeader& /*header*/) const override
    {
        ++headerCalls;
        return cv::Mat(4, 4, CV_8UC3, cv::Scalar(1, 1, 1));
    }

    cv::Mat renderPageFrame(const PageLayout& layout) const override
    {
        waitIfBlocked();
        if (layout.page.pageNumber == failOnPage) {
            throw RenderError("simulated render failure");
        }
        ++pageCalls;
        return cv::Mat(layout.rows, layout.columns, CV_8UC3,
                       cv::Scalar(layout.page.pageNumber, 0, 0));
    }

    cv::Mat renderControlFrame(ControlAction action, qint64 /*timestamp*/) const override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        controlActions.push_back(action);
        return cv::Mat(2, 2, CV_8UC3, cv::Scalar(0, 0, 0));
    }

    /**
     * Hold page rendering until release() is called
     */
    void block()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_blocked = true;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_blocked = false;
        }
        m_condition.notify_all();
    }

    std::vector<ControlAction> controls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return controlActions;
    }

    int failOnPage = 0;
    mutable std::atomic<int> headerCalls{0};
    mutable std::atomic<int> pageCalls{0};

private:
    void waitIfBlocked() const
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this]() { return !m_blocked; });
    }

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    bool m_blocked = false;
    mutable std::vector<ControlAction> controlActions;
};

/**
 * Surface recording every draw call
 */
class FakeSurface : public RenderSurface
{
public:
    struct DrawnImage {
        cv::Mat image;
        QPoint position;
        bool centered;
    };

    GridCapacity gridCapacity(DisplayMode /*mode*/) const override { return GridCapacity(5, 4); }

    void clear() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_clears;
    }

    void drawImage(const cv::Mat& image, const QPoint& position, bool centered) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_images.push_back({image, position, centered});
    }

    void drawText(const QPoint& /*position*/, const QString& text, const QColor& /*color*/) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_texts.push_back(text);
    }

    QPoint center() const override { return QPoint(400, 300); }

    std::vector<DrawnImage> images() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_images;
    }

    std::vector<QString> texts() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_texts;
    }

    int clears() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_clears;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<DrawnImage> m_images;
    std::vector<QString> m_texts;
    int m_clears = 0;
};

#endif // TESTFAKES_H
