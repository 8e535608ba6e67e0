#pragma once

#include "progress_event.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace pdf_mt {

// Workers push, the orchestrator thread drains.
class EventQueue {
public:
    void push(const ProgressEvent& event);
    std::vector<ProgressEvent> pop_all();

    // Blocks until an event arrives or the timeout passes.
    std::vector<ProgressEvent> wait_pop_all(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ProgressEvent> events_;
};

}  // namespace pdf_mt
