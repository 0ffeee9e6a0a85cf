#include <catch2/catch.hpp>
#include <rxsched/asio_scheduler.hpp>
#include <rxsched/scheduler.hpp>
#include <rxsched/submission_error.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rxsched;
using namespace std::chrono_literals;

TEST_CASE("asio_scheduler runs the tasks when the io_context is run", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    REQUIRE(&sched.context() == &ctx);
    int count = 0;
    bool in_ctx = false;
    schedule(sched, [&](shared_subscription) {
        count++;
        in_ctx = sched.running_in_this_thread();
    });
    REQUIRE(count == 0);
    ctx.run();
    REQUIRE(count == 1);
    REQUIRE(in_ctx);
    REQUIRE_FALSE(sched.running_in_this_thread());
}

TEST_CASE("asio_scheduler passes the state to the task", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    std::vector<int> values;
    for (int i = 0; i < 3; i++)
        schedule(
                sched, [&](shared_subscription, int v) { values.push_back(v); }, {}, i);
    ctx.run();
    REQUIRE(values == std::vector<int>{0, 1, 2});
}

TEST_CASE("asio_scheduler honors the delay", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point executed_at;
    schedule(
            sched, [&](shared_subscription) { executed_at = std::chrono::steady_clock::now(); },
            delay_type{20ms});
    ctx.run();
    REQUIRE(executed_at - start >= 20ms);
}

TEST_CASE("unsubscribing cancels the pending timer", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    auto sub = schedule(
            sched, [](shared_subscription) { FAIL("task is executed, and it shouldn't be"); },
            delay_type{10s});
    sub.unsubscribe();
    auto start = std::chrono::steady_clock::now();
    ctx.run();
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("unsubscribing from another thread cancels the pending timer", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    std::atomic<int> counter{0};
    auto sub = schedule(
            sched, [&](shared_subscription) { counter++; }, delay_type{50ms});
    std::thread runner{[&] { ctx.run(); }};
    std::this_thread::sleep_for(1ms);
    sub.unsubscribe();
    runner.join();
    REQUIRE(counter.load() == 0);
}

TEST_CASE("unsubscribed tasks without delay are skipped", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    auto sub = schedule(
            sched, [](shared_subscription) { FAIL("task is executed, and it shouldn't be"); });
    sub.unsubscribe();
    ctx.run();
}

TEST_CASE("asio_scheduler works with multiple threads running the io_context",
        "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    std::atomic<int> counter{0};
    for (int i = 0; i < 1000; i++)
        schedule(sched, [&](shared_subscription) { counter++; });
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++)
        threads.emplace_back([&] { ctx.run(); });
    for (auto& t : threads)
        t.join();
    REQUIRE(counter.load() == 1000);
}

TEST_CASE("stopped io_context rejects new work", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    ctx.stop();
    auto res = make_deferred<shared_subscription>(
            [](shared_subscription, int) { FAIL("task is executed, and it shouldn't be"); }, 0);
    try {
        sched.spawn(std::move(res.second), res.first);
        FAIL("submission_error expected");
    } catch (const submission_error& e) {
        REQUIRE(e.reason() == submission_failure::stopped);
    }
    REQUIRE(res.first.is_closed());

    SECTION("restarting the io_context accepts work again") {
        ctx.restart();
        int count = 0;
        schedule(sched, [&](shared_subscription) { count++; });
        ctx.run();
        REQUIRE(count == 1);
    }
}

TEST_CASE("asio_scheduler accepts work while a work guard keeps the io_context alive",
        "[asio_scheduler]") {
    boost::asio::io_context ctx;
    auto guard = boost::asio::make_work_guard(ctx);
    asio_scheduler sched{ctx};
    std::atomic<int> counter{0};
    std::thread runner{[&] { ctx.run(); }};
    for (int i = 0; i < 10; i++)
        schedule(sched, [&](shared_subscription) { counter++; });
    while (counter.load() < 10)
        std::this_thread::sleep_for(1ms);
    guard.reset();
    runner.join();
    REQUIRE(counter.load() == 10);
}

TEST_CASE("exceptions from tasks go to the except function", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    int num_exceptions = 0;
    asio_scheduler sched{ctx, [&](std::exception_ptr) { num_exceptions++; }};
    schedule(sched, [](shared_subscription) { throw std::runtime_error("test"); });
    ctx.run();
    REQUIRE(num_exceptions == 1);
}

TEST_CASE("without an except function, exceptions propagate out of run", "[asio_scheduler]") {
    boost::asio::io_context ctx;
    asio_scheduler sched{ctx};
    schedule(sched, [](shared_subscription) { throw std::runtime_error("test"); });
    REQUIRE_THROWS_AS(ctx.run(), std::runtime_error);
}

TEST_CASE("destroying the io_context closes the subscriptions of work that never ran",
        "[asio_scheduler]") {
    shared_subscription sub;
    shared_subscription delayed;
    {
        boost::asio::io_context ctx;
        asio_scheduler sched{ctx};
        sub = schedule(sched, [](shared_subscription) { FAIL("task is executed, and it shouldn't be"); });
        delayed = schedule(
                sched, [](shared_subscription) { FAIL("task is executed, and it shouldn't be"); },
                delay_type{10s});
        REQUIRE_FALSE(sub.is_closed());
    }
    REQUIRE(sub.is_closed());
    REQUIRE(delayed.is_closed());
}

TEST_CASE("asio_scheduler equality follows the io_context", "[asio_scheduler]") {
    boost::asio::io_context ctx1;
    boost::asio::io_context ctx2;
    REQUIRE(asio_scheduler{ctx1} == asio_scheduler{ctx1});
    REQUIRE(asio_scheduler{ctx1} != asio_scheduler{ctx2});
}
