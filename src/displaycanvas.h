#ifndef DISPLAYCANVAS_H
#define DISPLAYCANVAS_H

#include <QWidget>
#include <QImage>
#include <QMutex>
#include <QList>
#include <atomic>
#include "rendersurface.h"

/**
 * @brief Widget the transmission frames are shown on
 *
 * Draw commands may come from the scheduler thread. They are recorded under
 * a lock and a repaint is queued onto the GUI thread; paintEvent replays
 * the recorded commands.
 */
class DisplayCanvas : public QWidget, public RenderSurface
{
    Q_OBJECT

public:
    explicit DisplayCanvas(QWidget *parent = nullptr);

    /**
     * @brief Cells of CELL_SIZE px that fit with PAGE_ORIGIN px kept free on every side
     */
    GridCapacity gridCapacity(DisplayMode mode) const override;

    void clear() override;
    void drawImage(const cv::Mat& image, const QPoint& position, bool centered) override;
    void drawText(const QPoint& position, const QString& text, const QColor& color) override;
    QPoint center() const override;

    /**
     * @brief Convert a BGR or grayscale cv::Mat into a deep-copied QImage
     */
    static QImage toQImage(const cv::Mat& image);

    static constexpr int CELL_SIZE = 250;

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private:
    struct DrawCommand {
        enum class Kind { Image, Text };
        Kind kind;
        QPoint position;    // Top-left for images, text centre for text
        QImage image;
        QString text;
        QColor color;
    };

    void scheduleRepaint();

    mutable QMutex m_mutex;
    QList<DrawCommand> m_commands;

    // Cached for reads from the scheduler thread
    std::atomic<int> m_width;
    std::atomic<int> m_height;
};

#endif // DISPLAYCANVAS_H
