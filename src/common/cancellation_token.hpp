#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace fluxsync {

// Shared between the loop thread that owns a dispatch and the worker that
// serves it. Once cancelled, the worker's result is discarded.
class CancellationToken
{
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    bool isCancelled() const
    {
        return m_cancelled.load(std::memory_order_acquire);
    }

    // Callbacks run on the cancelling thread, once.
    void cancel()
    {
        if (m_cancelled.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            callbacks.swap(m_callbacks);
        }
        for (auto &callback : callbacks) {
            if (callback) {
                callback();
            }
        }
    }

    // Runs immediately when the token is already cancelled.
    void onCancel(Callback callback)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!isCancelled()) {
                m_callbacks.push_back(std::move(callback));
                return;
            }
        }
        if (callback) {
            callback();
        }
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::vector<Callback> m_callbacks;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace fluxsync
