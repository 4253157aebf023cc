/**
 * @file cancellation.cpp
 * @brief Shared cancellation state and callback registry
 *
 * @date 2025
 */

#include "crucible/core/cancellation.hpp"

#include <utility>

namespace crucible {
namespace core {

struct CancellationToken::Subscription::State {
    std::mutex mutex;
    std::atomic<bool> cancelled{false};
    std::uint64_t next_id{1};
    std::map<std::uint64_t, Callback> callbacks;
};

// ============================================================================
// Subscription
// ============================================================================

CancellationToken::Subscription::Subscription(std::shared_ptr<State> state, std::uint64_t id)
    : state_(std::move(state))
    , id_(id) {
}

CancellationToken::Subscription::~Subscription() {
    Reset();
}

CancellationToken::Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_))
    , id_(std::exchange(other.id_, 0)) {
}

CancellationToken::Subscription&
CancellationToken::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationToken::Subscription::Reset() {
    if (state_ && id_ != 0) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// ============================================================================
// CancellationToken
// ============================================================================

CancellationToken::CancellationToken()
    : state_(std::make_shared<Subscription::State>()) {
}

void CancellationToken::Cancel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true)) {
        return;
    }
    auto callbacks = std::move(state_->callbacks);
    state_->callbacks.clear();
    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool CancellationToken::IsCancelled() const {
    return state_->cancelled.load();
}

CancellationToken::Subscription CancellationToken::OnCancel(Callback callback) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.load()) {
        callback();
        return Subscription();
    }
    std::uint64_t id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(callback));
    return Subscription(state_, id);
}

} // namespace core
} // namespace crucible
