/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared between the loop and the sandbox
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace crucible {
namespace core {

/**
 * @class CancellationToken
 * @brief Copyable handle to a shared cancellation flag
 *
 * All copies observe the same state. Callbacks registered with OnCancel()
 * run exactly once, on the thread that calls Cancel() (or immediately, if
 * the token is already cancelled). Callbacks run under the token's lock and
 * must not register or drop subscriptions on the same token.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    /**
     * @class Subscription
     * @brief Keeps a callback registered for as long as it lives
     *
     * Destroying the subscription unregisters the callback. After the
     * destructor returns the callback is guaranteed not to be running.
     */
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void Reset();

    private:
        friend class CancellationToken;
        struct State;
        Subscription(std::shared_ptr<State> state, std::uint64_t id);

        std::shared_ptr<State> state_;
        std::uint64_t id_{0};
    };

    CancellationToken();

    void Cancel();
    bool IsCancelled() const;

    [[nodiscard]] Subscription OnCancel(Callback callback) const;

private:
    std::shared_ptr<Subscription::State> state_;
};

} // namespace core
} // namespace crucible
