#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

#include <QMetaObject>
#include <QObject>
#include <QThreadPool>

#include "common/cancellation_token.hpp"
#include "common/logging.hpp"

namespace fluxsync {

/**
 * WorkerPool runs blocking remote calls off the event loop.
 *
 * A task receives its own cancellation token and must only touch the
 * values it captured. Its result is posted back to the thread of
 * `context` with a queued call; once the token is cancelled the result is
 * dropped on either side of the hop, so a superseded worker can never
 * write state.
 *
 * Owners of `context` objects must cancel their tokens and call
 * waitForDone() before destroying the context.
 */
class WorkerPool
{
public:
    explicit WorkerPool(int maxWorkers);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // A pool that is not accepting refuses new tasks; callers fall back to
    // their offline path.
    bool isAccepting() const
    {
        return m_accepting.load(std::memory_order_acquire);
    }

    void setAccepting(bool accepting);

    // Returns nullptr when the task was refused.
    template <typename Task, typename Done>
    CancellationTokenPtr submit(QObject *context, Task task, Done onDone)
    {
        if (!isAccepting()) {
            return nullptr;
        }

        auto token = std::make_shared<CancellationToken>();
        track(token);
        const QString corrId = logging::currentCorrelationId();

        m_pool.start([context, task, onDone, token, corrId]() {
            logging::CorrelationScope scope(corrId);
            auto result = task(token);
            if (token->isCancelled()) {
                return;
            }
            QMetaObject::invokeMethod(
                context,
                [onDone, result, token, corrId]() {
                    if (token->isCancelled()) {
                        return;
                    }
                    logging::CorrelationScope loopScope(corrId);
                    onDone(result);
                },
                Qt::QueuedConnection);
        });
        return token;
    }

    void cancelAll();
    bool waitForDone(int msecs = -1);
    int activeThreadCount() const;

private:
    void track(const CancellationTokenPtr &token);

    QThreadPool m_pool;
    std::atomic<bool> m_accepting{true};
    std::mutex m_mutex;
    std::vector<std::weak_ptr<CancellationToken>> m_tokens;
};

} // namespace fluxsync
