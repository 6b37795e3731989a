#include "transmissionstate.h"
#include <QDebug>

QString transmissionPhaseName(TransmissionPhase phase)
{
    switch (phase) {
        case TransmissionPhase::Idle:
            return "Idle";
        case TransmissionPhase::StartMarker:
            return "StartMarker";
        case TransmissionPhase::Header:
            return "Header";
        case TransmissionPhase::Page:
            return "Page";
        case TransmissionPhase::EndMarker:
            return "EndMarker";
        case TransmissionPhase::Stopped:
            return "Stopped";
        default:
            return "Unknown";
    }
}

TransmissionStateMachine::TransmissionStateMachine(const TransmissionSettings& settings,
                                                   std::vector<Page> pages, int chunkCount)
    : m_settings(settings),
      m_pages(std::move(pages)),
      m_chunkCount(chunkCount),
      m_phase(TransmissionPhase::Idle),
      m_currentPage(0),
      m_cycleCount(1),
      m_ticksInPhase(0)
{
}

void TransmissionStateMachine::begin()
{
    m_currentPage = 0;
    m_cycleCount = 1;
    enter(m_settings.startMarker ? TransmissionPhase::StartMarker : TransmissionPhase::Header);
}

TransmissionStep TransmissionStateMachine::tick()
{
    TransmissionStep step;

    if (m_phase == TransmissionPhase::Idle || m_phase == TransmissionPhase::Stopped) {
        return step;
    }

    if (m_ticksInPhase == 0) {
        switch (m_phase) {
            case TransmissionPhase::StartMarker:
                step.display = TransmissionStep::Display::StartMarker;
                break;
            case TransmissionPhase::Header:
                step.display = TransmissionStep::Display::Header;
                break;
            case TransmissionPhase::Page:
                step.display = TransmissionStep::Display::Page;
                step.pageNumber = m_currentPage;
                break;
            case TransmissionPhase::EndMarker:
                step.display = TransmissionStep::Display::EndMarker;
                break;
            default:
                break;
        }
    }

    ++m_ticksInPhase;
    if (m_ticksInPhase >= dwellFor(m_phase)) {
        advance(step);
    }

    return step;
}

void TransmissionStateMachine::requestStop()
{
    switch (m_phase) {
        case TransmissionPhase::Stopped:
        case TransmissionPhase::EndMarker:
            return;
        case TransmissionPhase::Idle:
            enter(TransmissionPhase::Stopped);
            return;
        default:
            qDebug() << "TransmissionState: stop requested in" << transmissionPhaseName(m_phase);
            finish();
            return;
    }
}

void TransmissionStateMachine::abort()
{
    if (m_phase != TransmissionPhase::Stopped) {
        qDebug() << "TransmissionState: aborted in" << transmissionPhaseName(m_phase);
        enter(TransmissionPhase::Stopped);
    }
}

void TransmissionStateMachine::enter(TransmissionPhase phase)
{
    m_phase = phase;
    m_ticksInPhase = 0;
}

void TransmissionStateMachine::advance(TransmissionStep& step)
{
    switch (m_phase) {
        case TransmissionPhase::StartMarker:
            enter(TransmissionPhase::Header);
            break;

        case TransmissionPhase::Header:
            if (m_pages.empty()) {
                finish();
            } else {
                m_currentPage = 1;
                enter(TransmissionPhase::Page);
            }
            break;

        case TransmissionPhase::Page: {
            const int total = totalPages();
            step.progressReported = true;
            step.progress = static_cast<double>(m_currentPage) / total * 100.0;
            step.progressText = progressText(page(m_currentPage));

            if (m_currentPage < total) {
                ++m_currentPage;
                enter(TransmissionPhase::Page);
            } else if (m_settings.cycleMode == CycleMode::Single) {
                finish();
            } else {
                ++m_cycleCount;
                m_currentPage = 0;
                qDebug() << "TransmissionState: starting cycle" << m_cycleCount;
                enter(TransmissionPhase::Header);
            }
            break;
        }

        case TransmissionPhase::EndMarker:
            enter(TransmissionPhase::Stopped);
            break;

        default:
            break;
    }
}

void TransmissionStateMachine::finish()
{
    enter(m_settings.endMarker ? TransmissionPhase::EndMarker : TransmissionPhase::Stopped);
}

int TransmissionStateMachine::dwellFor(TransmissionPhase phase) const
{
    switch (phase) {
        case TransmissionPhase::StartMarker:
        case TransmissionPhase::EndMarker:
            return m_settings.controlDwellTicks();
        case TransmissionPhase::Header:
            return m_settings.headerDwellTicks();
        case TransmissionPhase::Page:
            return m_settings.pageDwellTicks();
        default:
            return 1;
    }
}

QString TransmissionStateMachine::progressText(const Page& page) const
{
    return QString("Page %1/%2, chunks %3-%4 of %5 (cycle %6)")
        .arg(page.pageNumber)
        .arg(totalPages())
        .arg(page.firstChunk + 1)
        .arg(page.endChunk)
        .arg(m_chunkCount)
        .arg(m_cycleCount);
}
