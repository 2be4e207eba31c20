#include "Module.h"
#include "ResultOrError.h"
#include "Service.h"
#include "ThreadSafeQueue.hpp"
#include <gtest/gtest.h>

#include <atomic>

class TestModule : public cl::Module {
public:
    explicit TestModule(const std::string &name) : cl::Module(name) {}
};

TEST(ModuleTest, LogIsUsableFromConst) {
    const TestModule module("module_test");
    EXPECT_NO_THROW(module.log().info << "Const test message");
    EXPECT_EQ(module.log().getName(), "module_test");
}

TEST(ModuleTest, RedirectLoggerReparents) {
    TestModule module("redirected_module");
    module.redirectLogger("module_owner");
    EXPECT_EQ(module.log().getFullName(), "module_owner.redirected_module");
}

TEST(ResultOrErrorTest, ValueAndError) {
    cl::ResultOrError<int> ok(7);
    EXPECT_TRUE(ok.isOk());
    EXPECT_EQ(*ok, 7);
    EXPECT_THROW(ok.error(), std::runtime_error);

    cl::ResultOrError<int> bad(cl::RoeErrorBase(5, "boom"));
    EXPECT_TRUE(bad.isError());
    EXPECT_FALSE(static_cast<bool>(bad));
    EXPECT_EQ(bad.error().code, 5);
    EXPECT_EQ(bad.valueOr(3), 3);
    EXPECT_THROW(bad.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
    cl::ResultOrError<void> ok;
    EXPECT_TRUE(ok.isOk());

    cl::ResultOrError<void> bad(cl::RoeErrorBase("failed"));
    EXPECT_TRUE(bad.isError());
    EXPECT_EQ(bad.error().message, "failed");
    EXPECT_EQ(bad.error().code, -1);
}

TEST(ThreadSafeQueueTest, PollsInFifoOrder) {
    cl::ThreadSafeQueue<int> queue;
    int out = 0;
    EXPECT_FALSE(queue.poll(out));

    queue.push(1);
    queue.push(2);
    ASSERT_TRUE(queue.poll(out));
    EXPECT_EQ(out, 1);
    ASSERT_TRUE(queue.poll(out));
    EXPECT_EQ(out, 2);
    EXPECT_FALSE(queue.poll(out));
}

namespace {

class CountingService : public cl::Service {
public:
    CountingService() : cl::Service("counting_service") {}
    ~CountingService() override { stop(); }

    std::atomic<int> loops{ 0 };
    std::atomic<bool> stopped{ false };
    bool failStart = false;

protected:
    Roe<void> onStart() override {
        if (failStart) {
            return Error(1, "refused");
        }
        return {};
    }

    void runLoop() override {
        while (!isStopSet()) {
            ++loops;
            sleepUnlessStopped(std::chrono::milliseconds(5));
        }
    }

    void onStop() override { stopped = true; }
};

} // namespace

TEST(ServiceTest, StartAndStop) {
    CountingService service;
    EXPECT_FALSE(service.isRunning());

    ASSERT_TRUE(service.start().isOk());
    EXPECT_TRUE(service.isRunning());
    EXPECT_TRUE(service.start().isError());

    while (service.loops < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    service.stop();
    EXPECT_FALSE(service.isRunning());
    EXPECT_TRUE(service.stopped);
}

TEST(ServiceTest, FailedOnStartDoesNotRun) {
    CountingService service;
    service.failStart = true;
    auto result = service.start();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, cl::Service::E_START);
    EXPECT_FALSE(service.isRunning());
}
