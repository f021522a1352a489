#include <gtest/gtest.h>
#include "migrator/transfer/transfer_queue.h"

#include <thread>
#include <vector>

namespace migrator {
namespace transfer {
namespace {

std::unique_ptr<FileTask> MakeTask(const std::string& id, TaskPriority priority = TaskPriority::NORMAL) {
    auto task = std::make_unique<FileTask>();
    task->id = id;
    task->priority = priority;
    return task;
}

TEST(TransferQueueTest, HigherPriorityFirstThenFifo) {
    TransferQueue queue;
    ASSERT_TRUE(queue.push(MakeTask("n1")).ok());
    ASSERT_TRUE(queue.push(MakeTask("low", TaskPriority::LOW)).ok());
    ASSERT_TRUE(queue.push(MakeTask("n2")).ok());
    ASSERT_TRUE(queue.push(MakeTask("crit", TaskPriority::CRITICAL)).ok());
    ASSERT_TRUE(queue.push(MakeTask("n3")).ok());

    std::vector<std::string> order;
    while (auto task = queue.tryPop()) {
        order.push_back(task->id);
    }
    EXPECT_EQ(order, (std::vector<std::string>{"crit", "n1", "n2", "n3", "low"}));
    EXPECT_TRUE(queue.empty());
}

TEST(TransferQueueTest, DuplicateIdRejected) {
    TransferQueue queue;
    ASSERT_TRUE(queue.push(MakeTask("a")).ok());
    auto duplicate = queue.push(MakeTask("a", TaskPriority::CRITICAL));
    ASSERT_FALSE(duplicate.ok());
    EXPECT_EQ(duplicate.code(), core::Error::Code::ALREADY_EXISTS);
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.tryPop()->priority, TaskPriority::NORMAL);

    // Once popped the id may be queued again.
    EXPECT_TRUE(queue.push(MakeTask("a")).ok());
}

TEST(TransferQueueTest, FullQueueAndNullTask) {
    TransferQueue queue(2);
    ASSERT_TRUE(queue.push(MakeTask("a")).ok());
    ASSERT_TRUE(queue.push(MakeTask("b")).ok());
    EXPECT_EQ(queue.push(MakeTask("c")).code(), core::Error::Code::RESOURCE_EXHAUSTED);
    EXPECT_EQ(queue.push(nullptr).code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST(TransferQueueTest, RequeueKeepsPlaceInLine) {
    TransferQueue queue;
    ASSERT_TRUE(queue.push(MakeTask("first")).ok());
    ASSERT_TRUE(queue.push(MakeTask("second")).ok());

    auto first = queue.tryPop();
    ASSERT_TRUE(queue.push(MakeTask("third")).ok());
    queue.requeue(std::move(first));

    EXPECT_EQ(queue.tryPop()->id, "first");
    EXPECT_EQ(queue.tryPop()->id, "second");
    EXPECT_EQ(queue.tryPop()->id, "third");
    EXPECT_EQ(queue.tryPop(), nullptr);
}

TEST(TransferQueueTest, QueuedTasksAreMarkedQueued) {
    TransferQueue queue;
    ASSERT_TRUE(queue.push(MakeTask("a")).ok());
    EXPECT_EQ(queue.tryPop()->status, core::TaskStatus::QUEUED);
}

TEST(TransferQueueTest, ConcurrentPopsTakeEachTaskOnce) {
    TransferQueue queue;
    for (int i = 0; i < 1000; ++i) {
        ASSERT_TRUE(queue.push(MakeTask("t" + std::to_string(i))).ok());
    }

    std::atomic<int> popped{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&] {
            while (queue.tryPop()) popped++;
        });
    }
    for (auto& worker : workers) worker.join();
    EXPECT_EQ(popped.load(), 1000);
    EXPECT_TRUE(queue.drain().empty());
}

} // namespace
} // namespace transfer
} // namespace migrator
