#include "engine/worker_pool.hpp"

#include <algorithm>

namespace fluxsync {

WorkerPool::WorkerPool(int maxWorkers)
{
    m_pool.setMaxThreadCount(std::max(1, maxWorkers));
}

WorkerPool::~WorkerPool()
{
    cancelAll();
    m_pool.waitForDone();
}

void WorkerPool::setAccepting(bool accepting)
{
    m_accepting.store(accepting, std::memory_order_release);
}

void WorkerPool::cancelAll()
{
    std::vector<std::weak_ptr<CancellationToken>> tokens;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tokens.swap(m_tokens);
    }
    for (const auto &weak : tokens) {
        if (auto token = weak.lock()) {
            token->cancel();
        }
    }
}

bool WorkerPool::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

int WorkerPool::activeThreadCount() const
{
    return m_pool.activeThreadCount();
}

void WorkerPool::track(const CancellationTokenPtr &token)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tokens.erase(std::remove_if(m_tokens.begin(), m_tokens.end(),
                                  [](const std::weak_ptr<CancellationToken> &weak) {
                                      return weak.expired();
                                  }),
                   m_tokens.end());
    m_tokens.push_back(token);
}

} // namespace fluxsync
