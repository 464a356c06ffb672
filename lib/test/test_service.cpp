#include "Module.h"
#include "Service.h"
#include "ThreadSafeQueue.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

class CountingService : public qc::Service {
public:
    CountingService() : qc::Service("qctest.counting") {}
    ~CountingService() override { stop(); }

    bool failStart{false};
    std::atomic<int> iterations{0};
    std::atomic<bool> stopped{false};

protected:
    Roe<void> onStart() override {
        if (failStart) {
            return Error(5, "refusing to start");
        }
        return {};
    }

    void runLoop() override {
        while (!isStopSet()) {
            ++iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void onStop() override { stopped = true; }
};

class NamedModule : public qc::Module {
public:
    explicit NamedModule(const std::string &name) : qc::Module(name) {}
};

template <typename Pred> bool waitFor(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

TEST(ModuleTest, LoggerCarriesModuleName) {
    NamedModule module("qctest.module.named");
    EXPECT_EQ(module.getLoggerName(), "qctest.module.named");
    EXPECT_EQ(module.log().getFullName(), "qctest.module.named");
}

TEST(ModuleTest, RedirectLoggerReparents) {
    NamedModule module("qctest.module.moved");
    module.redirectLogger("qctest.owner");
    EXPECT_EQ(module.log().getFullName(), "qctest.owner.moved");
}

TEST(ServiceTest, StartRunsLoopAndStopJoins) {
    CountingService service;
    EXPECT_FALSE(service.isRunning());

    ASSERT_TRUE(service.start().isOk());
    EXPECT_TRUE(service.isRunning());
    EXPECT_TRUE(waitFor([&] { return service.iterations > 2; }));

    service.stop();
    EXPECT_FALSE(service.isRunning());
    EXPECT_TRUE(service.isStopSet());
    EXPECT_TRUE(service.stopped);

    int after = service.iterations;
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(service.iterations, after);
}

TEST(ServiceTest, DoubleStartFails) {
    CountingService service;
    ASSERT_TRUE(service.start().isOk());
    EXPECT_TRUE(service.start().isError());
    service.stop();
}

TEST(ServiceTest, FailedOnStartLeavesServiceStopped) {
    CountingService service;
    service.failStart = true;
    auto result = service.start();
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.error().message.find("refusing to start"), std::string::npos);
    EXPECT_FALSE(service.isRunning());
}

TEST(ServiceTest, CanRestartAfterStop) {
    CountingService service;
    ASSERT_TRUE(service.start().isOk());
    service.stop();
    service.iterations = 0;
    ASSERT_TRUE(service.start().isOk());
    EXPECT_TRUE(waitFor([&] { return service.iterations > 0; }));
    service.stop();
}

TEST(ServiceTest, StopWithoutStartIsNoop) {
    CountingService service;
    service.stop();
    EXPECT_FALSE(service.stopped);
}

TEST(ThreadSafeQueueTest, PollIsFifo) {
    qc::ThreadSafeQueue<int> queue;
    int value = 0;
    EXPECT_FALSE(queue.poll(value));
    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2u);
    ASSERT_TRUE(queue.poll(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(queue.poll(value));
    EXPECT_EQ(value, 2);
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueueTest, PushBoundedDiscardsOldest) {
    qc::ThreadSafeQueue<int> queue;
    EXPECT_EQ(queue.pushBounded(1, 2), 0u);
    EXPECT_EQ(queue.pushBounded(2, 2), 0u);
    EXPECT_EQ(queue.pushBounded(3, 2), 1u);
    EXPECT_EQ(queue.size(), 2u);
    int value = 0;
    ASSERT_TRUE(queue.poll(value));
    EXPECT_EQ(value, 2);
}

TEST(ThreadSafeQueueTest, WaitPollTimesOutWhenEmpty) {
    qc::ThreadSafeQueue<int> queue;
    int value = 0;
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.waitPoll(value, std::chrono::milliseconds(20)));
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(20));
}

TEST(ThreadSafeQueueTest, WaitPollWakesOnPush) {
    qc::ThreadSafeQueue<std::string> queue;
    std::thread producer([&queue] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        queue.push(std::string("hello"));
    });
    std::string value;
    EXPECT_TRUE(queue.waitPoll(value, std::chrono::seconds(5)));
    EXPECT_EQ(value, "hello");
    producer.join();
}

TEST(ThreadSafeQueueTest, ClearDropsEverything) {
    qc::ThreadSafeQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.clear();
    EXPECT_TRUE(queue.empty());
}
