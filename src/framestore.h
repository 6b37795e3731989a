#ifndef FRAMESTORE_H
#define FRAMESTORE_H

#include <QHash>
#include <QList>
#include <QMutex>
#include <opencv2/opencv.hpp>

/**
 * Thread-safe map from frame key to rendered frame
 *
 * Page frames are keyed by their first chunk index; the header uses
 * HEADER_KEY. The lock is held only for the duration of each call, so
 * lookups never wait on rendering.
 */
class FrameStore
{
public:
    static constexpr int HEADER_KEY = -1;

    FrameStore() = default;

    void insert(int key, const cv::Mat& frame);

    /**
     * Non-blocking lookup
     * @param key Frame key
     * @param frame Receives the frame when present
     * @return false if the key has not been generated yet
     */
    bool find(int key, cv::Mat& frame) const;

    bool contains(int key) const;
    int size() const;
    QList<int> keys() const;
    void clear();

private:
    mutable QMutex m_mutex;
    QHash<int, cv::Mat> m_frames;
};

#endif // FRAMESTORE_H
