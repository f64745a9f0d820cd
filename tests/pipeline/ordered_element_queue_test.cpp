// =============================================================================
// sendstream-upgrade - Ordered Reassembly Queue Tests
// =============================================================================

#include "ssu/pipeline/ordered_element_queue.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace ssu::pipeline {
namespace {

struct Unit {
    CommandId first = 0;
    CommandId last = 0;
    bool shared = false;

    [[nodiscard]] CommandId firstId() const noexcept { return first; }
    [[nodiscard]] CommandId lastId() const noexcept { return last; }
    [[nodiscard]] bool isLastIdShared() const noexcept { return shared; }
};

Unit single(CommandId id) {
    return Unit{id, id, false};
}

CommandId releasedId(Result<std::optional<Unit>> item) {
    EXPECT_TRUE(item.has_value());
    EXPECT_TRUE(item->has_value());
    return (*item)->first;
}

TEST(OrderedElementQueueTest, ReleasesInIdOrder) {
    OrderedElementQueue<Unit> queue("ordered queue", 8);
    for (CommandId id : {3, 1, 0, 2}) {
        ASSERT_TRUE(queue.enqueue(single(id)).has_value());
    }
    for (CommandId expected = 0; expected < 4; ++expected) {
        EXPECT_EQ(releasedId(queue.dequeue()), expected);
    }
    EXPECT_EQ(queue.nextId(), 4u);
}

TEST(OrderedElementQueueTest, MultiIdUnitsAdvanceToLastPlusOne) {
    OrderedElementQueue<Unit> queue("ordered queue", 8);
    ASSERT_TRUE(queue.enqueue(Unit{5, 9, false}).has_value());
    ASSERT_TRUE(queue.enqueue(Unit{0, 4, false}).has_value());

    auto run = queue.dequeueRun();
    ASSERT_TRUE(run.has_value());
    ASSERT_EQ(run->size(), 2u);
    EXPECT_EQ((*run)[0].first, 0u);
    EXPECT_EQ((*run)[1].first, 5u);
    EXPECT_EQ(queue.nextId(), 10u);
}

TEST(OrderedElementQueueTest, SharedUnitWaitsForSuccessor) {
    OrderedElementQueue<Unit> queue("ordered queue", 8);
    ASSERT_TRUE(queue.enqueue(Unit{0, 3, true}).has_value());

    std::atomic<bool> released{false};
    std::thread consumer([&] {
        auto run = queue.dequeueRun();
        released = run.has_value() && !run->empty();
        ASSERT_TRUE(run.has_value());
        ASSERT_EQ(run->size(), 2u);
        EXPECT_EQ((*run)[1].first, 3u);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(released.load());

    ASSERT_TRUE(queue.enqueue(Unit{3, 6, false}).has_value());
    consumer.join();
    EXPECT_TRUE(released.load());
    EXPECT_EQ(queue.nextId(), 7u);
}

TEST(OrderedElementQueueTest, RejectsDuplicateStaleAndMalformedUnits) {
    OrderedElementQueue<Unit> queue("ordered queue", 8);
    ASSERT_TRUE(queue.enqueue(single(0)).has_value());
    ASSERT_TRUE(queue.enqueue(single(1)).has_value());

    EXPECT_EQ(queue.enqueue(single(1)).error().code(), ErrorCode::kInvalidState);
    EXPECT_EQ(releasedId(queue.dequeue()), 0u);
    EXPECT_EQ(queue.enqueue(single(0)).error().code(), ErrorCode::kInvalidState);

    EXPECT_FALSE(queue.enqueue(Unit{5, 4, false}).has_value());
    EXPECT_FALSE(queue.enqueue(Unit{6, 6, true}).has_value());
}

TEST(OrderedElementQueueTest, FullQueueStillAdmitsAwaitedUnit) {
    OrderedElementQueue<Unit> queue("ordered queue", 2);
    ASSERT_TRUE(queue.enqueue(single(1)).has_value());
    ASSERT_TRUE(queue.enqueue(single(2)).has_value());

    // Unit 0 is what the consumer needs; it must not block on capacity.
    ASSERT_TRUE(queue.enqueue(single(0)).has_value());
    EXPECT_EQ(queue.pendingCount(), 3u);
}

TEST(OrderedElementQueueTest, FullQueueAdmitsSharedSuccessor) {
    OrderedElementQueue<Unit> queue("ordered queue", 2);
    ASSERT_TRUE(queue.enqueue(Unit{0, 2, true}).has_value());
    ASSERT_TRUE(queue.enqueue(single(9)).has_value());

    ASSERT_TRUE(queue.enqueue(Unit{2, 4, false}).has_value());
    auto run = queue.dequeueRun();
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->size(), 2u);
}

TEST(OrderedElementQueueTest, FullQueueBlocksOtherUnits) {
    OrderedElementQueue<Unit> queue("ordered queue", 1);
    ASSERT_TRUE(queue.enqueue(single(1)).has_value());

    std::atomic<bool> admitted{false};
    std::thread producer([&] {
        admitted = queue.enqueue(single(2)).has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(admitted.load());

    ASSERT_TRUE(queue.enqueue(single(0)).has_value());
    EXPECT_EQ(releasedId(queue.dequeue()), 0u);
    EXPECT_EQ(releasedId(queue.dequeue()), 1u);
    producer.join();
    EXPECT_TRUE(admitted.load());
    EXPECT_EQ(releasedId(queue.dequeue()), 2u);
}

TEST(OrderedElementQueueTest, PlannedHaltReleasesRemainingHead) {
    OrderedElementQueue<Unit> queue("ordered queue", 4);
    ASSERT_TRUE(queue.enqueue(Unit{0, 1, true}).has_value());
    ASSERT_TRUE(queue.halt(false).has_value());

    auto run = queue.dequeueRun();
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->size(), 1u);

    auto end = queue.dequeue();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end->has_value());
}

TEST(OrderedElementQueueTest, UnplannedHaltWakesConsumer) {
    OrderedElementQueue<Unit> queue("ordered queue", 4);
    ASSERT_TRUE(queue.enqueue(single(3)).has_value());

    std::atomic<bool> cancelled{false};
    std::thread consumer([&] {
        auto item = queue.dequeue();
        cancelled = !item.has_value() && item.error().isCancellation();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(queue.halt(true).has_value());
    consumer.join();
    EXPECT_TRUE(cancelled.load());
}

TEST(OrderedElementQueueTest, SeventeenProducersStress) {
    constexpr int kProducers = 17;
    constexpr CommandId kUnits = 17 * 400;
    OrderedElementQueue<Unit> queue("ordered queue", 8);

    // Each producer owns the ids congruent to its index and sends them in
    // ascending order, so the awaited id is always some producer's next unit.
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            for (CommandId id = static_cast<CommandId>(p); id < kUnits; id += kProducers) {
                ASSERT_TRUE(queue.enqueue(single(id)).has_value());
            }
        });
    }

    CommandId expected = 0;
    while (expected < kUnits) {
        auto run = queue.dequeueRun();
        ASSERT_TRUE(run.has_value());
        for (const auto& unit : *run) {
            ASSERT_EQ(unit.first, expected);
            ++expected;
        }
    }

    for (auto& producer : producers) {
        producer.join();
    }
    ASSERT_TRUE(queue.halt(false).has_value());
    auto tail = queue.dequeueRun();
    ASSERT_TRUE(tail.has_value());
    EXPECT_TRUE(tail->empty());
}

}  // namespace
}  // namespace ssu::pipeline
