#include "event_queue.hpp"

namespace pdf_mt {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::FileStarted:
            return "file_started";
        case EventType::PageDone:
            return "page_done";
        case EventType::PageSkipped:
            return "page_skipped";
        case EventType::PageFailed:
            return "page_failed";
        case EventType::FileDone:
            return "file_done";
        case EventType::FileCancelled:
            return "file_cancelled";
        case EventType::FileFailed:
            return "file_failed";
        case EventType::Finished:
            return "finished";
    }
    return "unknown";
}

void EventQueue::push(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    cv_.notify_one();
}

std::vector<ProgressEvent> EventQueue::pop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> out;
    out.swap(events_);
    return out;
}

std::vector<ProgressEvent> EventQueue::wait_pop_all(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !events_.empty(); });
    std::vector<ProgressEvent> out;
    out.swap(events_);
    return out;
}

}  // namespace pdf_mt
