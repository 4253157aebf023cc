/**
 * @file event_sinks.hpp
 * @brief Ready-made observers for loop transitions
 *
 * @date 2025
 */

#pragma once

#include "crucible/loop/interfaces.hpp"
#include "crucible/reporters/json_reporter.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>
#include <vector>

namespace crucible {
namespace loop {

/**
 * @class LoggingEventSink
 * @brief Writes every event to spdlog
 */
class LoggingEventSink : public EventSink {
public:
    void Emit(const LoopEvent& event) override;
};

/**
 * @class JsonLinesEventSink
 * @brief One JSON object per line on a stream
 *
 * The stream must outlive the sink.
 */
class JsonLinesEventSink : public EventSink {
public:
    explicit JsonLinesEventSink(std::ostream& out);

    void Emit(const LoopEvent& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
    reporters::JsonReporter reporter_;
};

/**
 * @class FanOutEventSink
 * @brief Forwards each event to several sinks
 */
class FanOutEventSink : public EventSink {
public:
    explicit FanOutEventSink(std::vector<std::shared_ptr<EventSink>> sinks);

    void Emit(const LoopEvent& event) override;

private:
    std::vector<std::shared_ptr<EventSink>> sinks_;
};

/**
 * @class AsyncEventSink
 * @brief Bounded queue in front of a slow sink
 *
 * Emit() only enqueues; a worker thread delivers events in order. When the
 * queue is full the event is dropped and counted, so the loop never waits
 * for an observer. The destructor delivers what is still queued.
 */
class AsyncEventSink : public EventSink {
public:
    AsyncEventSink(std::shared_ptr<EventSink> inner, std::size_t capacity = 256);
    ~AsyncEventSink() override;

    AsyncEventSink(const AsyncEventSink&) = delete;
    AsyncEventSink& operator=(const AsyncEventSink&) = delete;

    void Emit(const LoopEvent& event) override;

    /**
     * @brief Block until every queued event has been delivered
     */
    void Flush();

    /**
     * @brief Deliver remaining events and stop the worker (idempotent)
     */
    void Stop();

    std::uint64_t GetDroppedCount() const { return dropped_.load(); }

private:
    void Worker();

    std::shared_ptr<EventSink> inner_;
    std::size_t capacity_;

    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<LoopEvent> queue_;
    bool stopped_{false};
    bool delivering_{false};
    std::atomic<std::uint64_t> dropped_{0};

    std::thread worker_;
};

} // namespace loop
} // namespace crucible
