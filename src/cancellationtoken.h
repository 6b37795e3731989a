#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <atomic>
#include <memory>

/**
 * Shared stop request between a controller and one worker loop
 * Copies observe the same flag.
 */
class CancellationToken
{
public:
    CancellationToken() : m_cancelled(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_cancelled->store(true); }
    bool isCancelled() const { return m_cancelled->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_cancelled;
};

#endif // CANCELLATIONTOKEN_H
