#pragma once

#include <cstddef>
#include <string>

namespace pdf_mt {

enum class EventType {
    FileStarted,
    PageDone,
    PageSkipped,
    PageFailed,
    FileDone,
    FileCancelled,
    FileFailed,
    Finished
};

struct ProgressEvent {
    EventType type = EventType::PageDone;
    std::string path;
    std::string message;
    std::size_t file_index = 0;
    std::size_t total_files = 0;
    int page_index = -1;
    std::size_t done_pages = 0;
    std::size_t total_pages = 0;
};

const char* event_type_name(EventType type);

}  // namespace pdf_mt
