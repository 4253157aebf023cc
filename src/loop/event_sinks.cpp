/**
 * @file event_sinks.cpp
 * @brief Logging, JSON-lines, fan-out and asynchronous event sinks
 *
 * @date 2025
 */

#include "crucible/loop/event_sinks.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace crucible {
namespace loop {

// ============================================================================
// LOGGING
// ============================================================================

void LoggingEventSink::Emit(const LoopEvent& event) {
    switch (event.phase) {
        case LoopPhase::SUCCEEDED:
            spdlog::info("[{}] ✓ {}: {}", event.session_id, ToString(event.phase), event.message);
            break;
        case LoopPhase::EXHAUSTED:
        case LoopPhase::CANCELLED:
            spdlog::warn("[{}] ✗ {}: {}", event.session_id, ToString(event.phase), event.message);
            break;
        case LoopPhase::REQUESTING_REPAIR:
            spdlog::info("[{}] iteration {} failed ({}), requesting repair",
                         event.session_id, event.iteration + 1,
                         event.failure_kind ? core::ToString(*event.failure_kind) : event.message);
            break;
        default:
            spdlog::info("[{}] iteration {}: {} ({})",
                         event.session_id, event.iteration + 1, ToString(event.phase), event.message);
            break;
    }
}

// ============================================================================
// JSON LINES
// ============================================================================

JsonLinesEventSink::JsonLinesEventSink(std::ostream& out)
    : out_(out) {}

void JsonLinesEventSink::Emit(const LoopEvent& event) {
    std::string line = reporters::JsonReporter::DumpLine(reporter_.ToJson(event));

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

// ============================================================================
// FAN-OUT
// ============================================================================

FanOutEventSink::FanOutEventSink(std::vector<std::shared_ptr<EventSink>> sinks)
    : sinks_(std::move(sinks)) {}

void FanOutEventSink::Emit(const LoopEvent& event) {
    for (auto& sink : sinks_) {
        if (!sink) {
            continue;
        }
        try {
            sink->Emit(event);
        } catch (const std::exception& e) {
            spdlog::warn("Event sink failed: {}", e.what());
        }
    }
}

// ============================================================================
// ASYNC
// ============================================================================

AsyncEventSink::AsyncEventSink(std::shared_ptr<EventSink> inner, std::size_t capacity)
    : inner_(std::move(inner))
    , capacity_(capacity) {

    if (!inner_) {
        throw std::invalid_argument("AsyncEventSink requires an inner sink");
    }
    if (capacity_ == 0) {
        throw std::invalid_argument("AsyncEventSink capacity must be positive");
    }
    worker_ = std::thread(&AsyncEventSink::Worker, this);
}

AsyncEventSink::~AsyncEventSink() {
    Stop();
}

void AsyncEventSink::Emit(const LoopEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ || queue_.size() >= capacity_) {
            dropped_++;
            return;
        }
        queue_.push_back(event);
    }
    queue_cv_.notify_one();
}

void AsyncEventSink::Flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

void AsyncEventSink::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    queue_cv_.notify_all();
    if (!worker_.joinable()) {
        return;
    }
    worker_.join();

    auto dropped = dropped_.load();
    if (dropped > 0) {
        spdlog::warn("Dropped {} loop event(s): observer too slow", dropped);
    }
}

void AsyncEventSink::Worker() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return stopped_ || !queue_.empty(); });
        if (queue_.empty()) {
            break;  // stopped and drained
        }

        LoopEvent event = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        try {
            inner_->Emit(event);
        } catch (const std::exception& e) {
            spdlog::warn("Event sink failed: {}", e.what());
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) {
            drained_cv_.notify_all();
        }
    }
    drained_cv_.notify_all();
}

} // namespace loop
} // namespace crucible
