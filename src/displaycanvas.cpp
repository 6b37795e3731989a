#include "displaycanvas.h"
#include <QFont>
#include <QFontMetrics>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPainter>
#include <QResizeEvent>

DisplayCanvas::DisplayCanvas(QWidget *parent)
    : QWidget(parent),
      m_width(0),
      m_height(0)
{
    setMinimumSize(600, 500);
    setAutoFillBackground(true);

    QPalette pal = palette();
    pal.setColor(QPalette::Window, Qt::white);
    setPalette(pal);
}

GridCapacity DisplayCanvas::gridCapacity(DisplayMode /*mode*/) const
{
    // Both modes use the same cell geometry
    return GridCapacity::fitting(m_width.load(), m_height.load(), CELL_SIZE, PAGE_ORIGIN);
}

void DisplayCanvas::clear()
{
    {
        QMutexLocker locker(&m_mutex);
        m_commands.clear();
    }
    scheduleRepaint();
}

void DisplayCanvas::drawImage(const cv::Mat& image, const QPoint& position, bool centered)
{
    DrawCommand command;
    command.kind = DrawCommand::Kind::Image;
    command.image = toQImage(image);
    if (command.image.isNull()) {
        return;
    }

    command.position = centered
        ? QPoint(position.x() - command.image.width() / 2, position.y() - command.image.height() / 2)
        : position;

    {
        QMutexLocker locker(&m_mutex);
        m_commands.append(command);
    }
    scheduleRepaint();
}

void DisplayCanvas::drawText(const QPoint& position, const QString& text, const QColor& color)
{
    DrawCommand command;
    command.kind = DrawCommand::Kind::Text;
    command.position = position;
    command.text = text;
    command.color = color;

    {
        QMutexLocker locker(&m_mutex);
        m_commands.append(command);
    }
    scheduleRepaint();
}

QPoint DisplayCanvas::center() const
{
    return QPoint(m_width.load() / 2, m_height.load() / 2);
}

QImage DisplayCanvas::toQImage(const cv::Mat& image)
{
    if (image.empty()) {
        return QImage();
    }

    if (image.type() == CV_8UC3) {
        QImage view(image.data, image.cols, image.rows, static_cast<int>(image.step), QImage::Format_BGR888);
        return view.copy();
    }
    if (image.type() == CV_8UC1) {
        QImage view(image.data, image.cols, image.rows, static_cast<int>(image.step), QImage::Format_Grayscale8);
        return view.copy();
    }
    return QImage();
}

void DisplayCanvas::paintEvent(QPaintEvent* /*event*/)
{
    QList<DrawCommand> commands;
    {
        QMutexLocker locker(&m_mutex);
        commands = m_commands;
    }

    QPainter painter(this);
    painter.fillRect(rect(), Qt::white);

    QFont font("Arial", 20);
    font.setBold(true);
    painter.setFont(font);
    QFontMetrics metrics(font);

    for (const DrawCommand& command : commands) {
        if (command.kind == DrawCommand::Kind::Image) {
            painter.drawImage(command.position, command.image);
        } else {
            painter.setPen(command.color);
            QRect textRect = metrics.boundingRect(command.text);
            textRect.moveCenter(command.position);
            painter.drawText(textRect, Qt::AlignCenter, command.text);
        }
    }
}

void DisplayCanvas::resizeEvent(QResizeEvent* event)
{
    m_width.store(event->size().width());
    m_height.store(event->size().height());
    QWidget::resizeEvent(event);
}

void DisplayCanvas::scheduleRepaint()
{
    QMetaObject::invokeMethod(this, [this]() { update(); }, Qt::QueuedConnection);
}
