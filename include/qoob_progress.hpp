#pragma once
/**
 * @file qoob_progress.hpp
 * @brief Operation results and progress reporting
 *
 * The programmer pushes progress to a ProgressSink after every page or
 * sector and hands the final OperationResult to on_finished(). Sinks are
 * called on the programmer's thread; a sink that may be slow must be wrapped
 * in a QueuedProgressSink so the USB protocol never waits on the consumer.
 */

#include "qoob_error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace qoob {

// ============================================================================
// Operation result
// ============================================================================

enum class OperationKind : uint8_t {
    Erase,
    Write,
    Read,
    Verify,
    Reset
};

const char* operation_name(OperationKind kind);

struct OperationResult {
    bool success{false};
    OperationKind operation{OperationKind::Read};
    Error error;                              ///< valid if !success

    std::vector<uint8_t> data;                ///< read() output

    // Position
    uint32_t start_address{0};
    std::optional<uint32_t> last_good_address; ///< Last confirmed page/sector
    uint32_t resume_address{0};               ///< First unconfirmed address

    // Statistics
    uint32_t bytes_done{0};
    uint32_t total_bytes{0};
    uint32_t commands_sent{0};
    uint16_t retry_count{0};
    std::chrono::milliseconds elapsed_time{};

    // Diagnostics
    std::vector<std::string> log_messages;
};

// ============================================================================
// Sinks
// ============================================================================

class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    /// A stage starts; total is in bytes
    virtual void on_stage(Stage stage, uint32_t total) = 0;

    /// Bytes done so far within the current stage
    virtual void on_progress(Stage stage, uint32_t done, uint32_t total) = 0;

    virtual void on_finished(const OperationResult& result) = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void on_stage(Stage, uint32_t) override {}
    void on_progress(Stage, uint32_t, uint32_t) override {}
    void on_finished(const OperationResult&) override {}
};

/// Forwards to optional callbacks
class CallbackProgressSink : public ProgressSink {
public:
    std::function<void(Stage, uint32_t)> stage_callback;
    std::function<void(Stage, uint32_t, uint32_t)> progress_callback;
    std::function<void(const OperationResult&)> finished_callback;

    void on_stage(Stage stage, uint32_t total) override {
        if (stage_callback) stage_callback(stage, total);
    }
    void on_progress(Stage stage, uint32_t done, uint32_t total) override {
        if (progress_callback) progress_callback(stage, done, total);
    }
    void on_finished(const OperationResult& result) override {
        if (finished_callback) finished_callback(result);
    }
};

/**
 * @brief Decouples the programmer from a slow downstream sink
 *
 * Calls only enqueue and return. A worker thread delivers events in order.
 * Consecutive progress events of the same stage collapse into the newest
 * one, so the queue stays short however slow the consumer is.
 */
class QueuedProgressSink : public ProgressSink {
public:
    explicit QueuedProgressSink(ProgressSink& downstream);
    ~QueuedProgressSink() override;

    QueuedProgressSink(const QueuedProgressSink&) = delete;
    QueuedProgressSink& operator=(const QueuedProgressSink&) = delete;

    void on_stage(Stage stage, uint32_t total) override;
    void on_progress(Stage stage, uint32_t done, uint32_t total) override;
    void on_finished(const OperationResult& result) override;

    /// Block until every queued event has been delivered
    void flush();

    /// Events currently waiting
    size_t pending() const;

    /// Progress events dropped because a newer one replaced them
    uint64_t coalesced() const { return coalesced_.load(); }

private:
    enum class EventType { Stage, Progress, Finished };

    struct Event {
        EventType type{EventType::Progress};
        Stage stage{Stage::None};
        uint32_t done{0};
        uint32_t total{0};
        std::optional<OperationResult> result;
    };

    void push(Event event);
    void worker_loop();

    ProgressSink& downstream_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Event> queue_;
    bool delivering_{false};
    std::atomic<bool> running_{true};
    std::atomic<uint64_t> coalesced_{0};
    std::thread worker_;
};

} // namespace qoob
