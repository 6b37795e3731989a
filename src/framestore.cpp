#include "framestore.h"
#include <QMutexLocker>

void FrameStore::insert(int key, const cv::Mat& frame)
{
    QMutexLocker locker(&m_mutex);
    m_frames.insert(key, frame);
}

bool FrameStore::find(int key, cv::Mat& frame) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_frames.constFind(key);
    if (it == m_frames.constEnd()) {
        return false;
    }
    frame = it.value();
    return true;
}

bool FrameStore::contains(int key) const
{
    QMutexLocker locker(&m_mutex);
    return m_frames.contains(key);
}

int FrameStore::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_frames.size());
}

QList<int> FrameStore::keys() const
{
    QMutexLocker locker(&m_mutex);
    return m_frames.keys();
}

void FrameStore::clear()
{
    QMutexLocker locker(&m_mutex);
    m_frames.clear();
}
