#include "qoob_progress.hpp"

namespace qoob {

const char* operation_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::Erase: return "erase";
        case OperationKind::Write: return "write";
        case OperationKind::Read: return "read";
        case OperationKind::Verify: return "verify";
        case OperationKind::Reset: return "reset";
        default: return "unknown";
    }
}

// ============================================================================
// QueuedProgressSink
// ============================================================================

QueuedProgressSink::QueuedProgressSink(ProgressSink& downstream)
    : downstream_(downstream) {
    worker_ = std::thread(&QueuedProgressSink::worker_loop, this);
}

QueuedProgressSink::~QueuedProgressSink() {
    flush();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void QueuedProgressSink::on_stage(Stage stage, uint32_t total) {
    Event e;
    e.type = EventType::Stage;
    e.stage = stage;
    e.total = total;
    push(std::move(e));
}

void QueuedProgressSink::on_progress(Stage stage, uint32_t done, uint32_t total) {
    Event e;
    e.type = EventType::Progress;
    e.stage = stage;
    e.done = done;
    e.total = total;
    push(std::move(e));
}

void QueuedProgressSink::on_finished(const OperationResult& result) {
    Event e;
    e.type = EventType::Finished;
    e.result = result;
    push(std::move(e));
}

void QueuedProgressSink::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (event.type == EventType::Progress && !queue_.empty()) {
            Event& last = queue_.back();
            if (last.type == EventType::Progress && last.stage == event.stage) {
                last = std::move(event);
                ++coalesced_;
                return;
            }
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

size_t QueuedProgressSink::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void QueuedProgressSink::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

void QueuedProgressSink::worker_loop() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });

            if (queue_.empty()) {
                if (!running_) break;
                continue;
            }

            event = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
        }

        switch (event.type) {
            case EventType::Stage:
                downstream_.on_stage(event.stage, event.total);
                break;
            case EventType::Progress:
                downstream_.on_progress(event.stage, event.done, event.total);
                break;
            case EventType::Finished:
                downstream_.on_finished(*event.result);
                break;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            delivering_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace qoob
