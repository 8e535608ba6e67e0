#include "event_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace pdf_mt {
namespace {

ProgressEvent page_done(int page_index) {
    ProgressEvent event;
    event.type = EventType::PageDone;
    event.page_index = page_index;
    return event;
}

TEST(EventQueueTest, PopAllDrainsInOrder) {
    EventQueue queue;
    queue.push(page_done(0));
    queue.push(page_done(1));

    const auto events = queue.pop_all();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].page_index, 0);
    EXPECT_EQ(events[1].page_index, 1);
    EXPECT_TRUE(queue.pop_all().empty());
}

TEST(EventQueueTest, WaitTimesOutWhenEmpty) {
    EventQueue queue;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(queue.wait_pop_all(std::chrono::milliseconds(20)).empty());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(15));
}

TEST(EventQueueTest, WaitWakesOnPush) {
    EventQueue queue;
    std::jthread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        queue.push(page_done(7));
    });

    std::vector<ProgressEvent> events;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (events.empty() && std::chrono::steady_clock::now() < deadline) {
        events = queue.wait_pop_all(std::chrono::milliseconds(1000));
    }
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].page_index, 7);
}

TEST(EventQueueTest, ManyProducers) {
    EventQueue queue;
    {
        std::vector<std::jthread> producers;
        for (int t = 0; t < 4; ++t) {
            producers.emplace_back([&queue, t]() {
                for (int i = 0; i < 100; ++i) {
                    queue.push(page_done(t * 100 + i));
                }
            });
        }
    }
    EXPECT_EQ(queue.pop_all().size(), 400u);
}

TEST(EventQueueTest, EventNames) {
    EXPECT_STREQ(event_type_name(EventType::PageDone), "page_done");
    EXPECT_STREQ(event_type_name(EventType::FileCancelled), "file_cancelled");
    EXPECT_STREQ(event_type_name(EventType::Finished), "finished");
}

}  // namespace
}  // namespace pdf_mt
