#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "courier/core/cancellation.hpp"
#include "courier/core/future.hpp"

using namespace courier;

TEST(FutureTest, GetBlocksUntilFulfilled) {
  Promise<int> promise;
  auto future = promise.get_future();
  EXPECT_FALSE(future.ready());

  std::thread producer([&promise] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    promise.set_value(42);
  });

  EXPECT_EQ(future.get(), 42);
  EXPECT_TRUE(future.ready());
  producer.join();
}

TEST(FutureTest, SetValueOnlyOnce) {
  Promise<std::string> promise;
  EXPECT_TRUE(promise.set_value("first"));
  EXPECT_FALSE(promise.set_value("second"));
  EXPECT_TRUE(promise.fulfilled());
  EXPECT_EQ(promise.get_future().get(), "first");
}

TEST(FutureTest, ContinuationRunsOnFulfilment) {
  Promise<int> promise;
  auto future = promise.get_future();

  int seen = 0;
  future.then([&seen](const int& value) { seen = value; });
  EXPECT_EQ(seen, 0);

  promise.set_value(7);
  EXPECT_EQ(seen, 7);
}

TEST(FutureTest, ContinuationAfterFulfilmentRunsImmediately) {
  auto future = make_ready_future(5);

  // 已完成的 future 上注册的回调应立即执行
  bool called = false;
  future.then([&called](const int& value) {
    called = true;
    EXPECT_EQ(value, 5);
  });
  EXPECT_TRUE(called);
}

TEST(FutureTest, MultipleContinuationsAllRun) {
  Promise<int> promise;
  auto future = promise.get_future();

  std::atomic<int> calls{0};
  for (int i = 0; i < 3; ++i) {
    future.then([&calls](const int&) { ++calls; });
  }
  promise.set_value(1);
  future.then([&calls](const int&) { ++calls; });

  EXPECT_EQ(calls.load(), 4);
}

TEST(FutureTest, WaitForTimesOut) {
  Promise<int> promise;
  auto future = promise.get_future();
  EXPECT_FALSE(future.wait_for(std::chrono::milliseconds(10)));

  promise.set_value(3);
  EXPECT_TRUE(future.wait_for(std::chrono::milliseconds(10)));
}

TEST(FutureTest, DefaultFutureIsInvalid) {
  Future<int> future;
  EXPECT_FALSE(future.valid());
  EXPECT_TRUE(Promise<int>().get_future().valid());
}

TEST(CancellationTest, CallbacksRunOnce) {
  auto token = Cancellation::create();
  int first = 0;
  int removed = 0;
  token->on_cancel([&first] { ++first; });
  auto id = token->on_cancel([&removed] { ++removed; });
  token->remove(id);
  EXPECT_FALSE(token->cancelled());

  token->cancel();
  token->cancel();
  EXPECT_TRUE(token->cancelled());
  EXPECT_EQ(first, 1);
  EXPECT_EQ(removed, 0);

  // 已取消后注册的回调立即执行
  int late = 0;
  EXPECT_EQ(token->on_cancel([&late] { ++late; }), 0u);
  EXPECT_EQ(late, 1);
}
