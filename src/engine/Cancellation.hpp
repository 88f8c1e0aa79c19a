#pragma once

#include <atomic>
#include <memory>

namespace flowgraph {

/**
 * Read side of a cancellation flag, checked by engines between nodes
 *
 * A default-constructed token can never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const { return m_flag && m_flag->load(); }
    bool canBeCancelled() const { return m_flag != nullptr; }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : m_flag(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> m_flag;
};

/**
 * Owner of a cancellation flag
 *
 * Usage:
 *   CancellationSource source;
 *   auto future = GraphExecutor::executeAsync(graph, source.getToken());
 *   source.cancel();
 */
class CancellationSource {
public:
    CancellationSource()
        : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken getToken() const { return CancellationToken(m_flag); }
    void cancel() { m_flag->store(true); }
    bool isCancellationRequested() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace flowgraph
