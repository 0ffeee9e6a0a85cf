#include <catch2/catch.hpp>
#include <rxsched/thread_pool.hpp>
#include <rxsched/scheduler.hpp>
#include <rxsched/submission_error.hpp>
#include "test_common/task_countdown.hpp"
#include "test_common/task_utils.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rxsched;
using namespace std::chrono_literals;

TEST_CASE("Can create a thread_pool", "[thread_pool]") {
    thread_pool my_pool{4};
    REQUIRE(my_pool.num_workers() == 4);
    my_pool.scheduler(); // discard the result
    // destructor is called now
}

TEST_CASE("thread_pool uses all the cores by default", "[thread_pool]") {
    thread_pool my_pool{pool_config{}};
    REQUIRE(my_pool.num_workers() >= 1);
}

TEST_CASE("worker start function is called for each worker", "[thread_pool]") {
    std::atomic<int> count{0};
    pool_config config;
    config.num_workers_ = 3;
    config.worker_start_fun_ = [&] { count++; };
    thread_pool my_pool{config};
    REQUIRE(bounded_wait_count(count, 3));
}

TEST_CASE("thread_pool executes all the scheduled tasks", "[thread_pool]") {
    std::atomic<int> counter{0};
    thread_pool my_pool{4};
    auto sched = my_pool.scheduler();
    for (int i = 0; i < 1000; i++)
        schedule(sched, [&](shared_subscription) { counter++; });
    my_pool.wait();
    REQUIRE(counter.load() == 1000);
}

TEST_CASE("thread_pool runs the tasks on its worker threads", "[thread_pool]") {
    thread_pool my_pool{4};
    auto sched = my_pool.scheduler();
    REQUIRE_FALSE(sched.running_in_this_thread());

    std::mutex m;
    std::set<std::thread::id> ids;
    std::atomic<bool> all_in_pool{true};
    for (int i = 0; i < 100; i++)
        schedule(sched, [&](shared_subscription) {
            if (!sched.running_in_this_thread())
                all_in_pool = false;
            waste_time(100);
            std::lock_guard<std::mutex> lock{m};
            ids.insert(std::this_thread::get_id());
        });
    my_pool.wait();
    REQUIRE(all_in_pool.load());
    REQUIRE(ids.count(std::this_thread::get_id()) == 0);
    REQUIRE(ids.size() <= 4);
}

TEST_CASE("thread_pool can run the tasks in parallel", "[thread_pool]") {
    thread_pool my_pool{4};
    std::atomic<int> num_parallel{0};
    std::atomic<bool> done{false};
    std::atomic<int> max_parallel{0};
    for (int i = 0; i < 4; i++)
        schedule(my_pool.scheduler(), [&](shared_subscription) {
            int cur = ++num_parallel;
            int prev = max_parallel.load();
            while (prev < cur && !max_parallel.compare_exchange_weak(prev, cur)) {
            }
            bounded_wait([&] { return done.load() || num_parallel.load() == 4; });
            done = true;
        });
    my_pool.wait();
    REQUIRE(max_parallel.load() > 1);
}

TEST_CASE("delayed tasks are not executed earlier than their delay", "[thread_pool]") {
    std::chrono::steady_clock::time_point executed_at;
    task_countdown tc{1};
    thread_pool my_pool{2};
    auto start = std::chrono::steady_clock::now();
    schedule(
            my_pool.scheduler(),
            [&](shared_subscription) {
                executed_at = std::chrono::steady_clock::now();
                tc.task_finished();
            },
            delay_type{20ms});
    REQUIRE(tc.wait_for_all());
    REQUIRE(executed_at - start >= 20ms);
}

TEST_CASE("delayed tasks are executed in deadline order", "[thread_pool]") {
    thread_pool my_pool{1};
    std::mutex m;
    std::vector<int> order;
    auto sched = my_pool.scheduler();
    auto record = [&](shared_subscription, int idx) {
        std::lock_guard<std::mutex> lock{m};
        order.push_back(idx);
    };
    schedule(sched, record, delay_type{30ms}, 3);
    schedule(sched, record, delay_type{10ms}, 1);
    schedule(sched, record, delay_type{20ms}, 2);
    my_pool.wait();
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("unsubscribing a delayed task prevents its execution", "[thread_pool]") {
    std::atomic<int> counter{0};
    thread_pool my_pool{2};
    auto sub = schedule(
            my_pool.scheduler(), [&](shared_subscription) { counter++; }, delay_type{50ms});
    std::this_thread::sleep_for(1ms);
    sub.unsubscribe();
    std::this_thread::sleep_for(200ms);
    REQUIRE(counter.load() == 0);
}

TEST_CASE("unsubscribing before the task starts prevents its execution", "[thread_pool]") {
    thread_pool my_pool{1};
    auto sched = my_pool.scheduler();

    // Keep the only worker busy, so that the next task cannot start
    std::atomic<bool> release{false};
    std::atomic<bool> blocker_started{false};
    schedule(sched, [&](shared_subscription) {
        blocker_started = true;
        bounded_wait([&] { return release.load(); });
    });
    REQUIRE(bounded_wait([&] { return blocker_started.load(); }));

    std::atomic<int> counter{0};
    auto sub = schedule(sched, [&](shared_subscription) { counter++; });
    sub.unsubscribe();
    release = true;
    my_pool.wait();
    REQUIRE(counter.load() == 0);
}

TEST_CASE("unsubscribing after the task started does not interrupt it", "[thread_pool]") {
    std::atomic<int> counter{0};
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    thread_pool my_pool{2};
    auto sub = schedule(my_pool.scheduler(), [&](shared_subscription s) {
        started = true;
        bounded_wait([&] { return release.load(); });
        if (s.is_closed())
            counter++;
    });
    REQUIRE(bounded_wait([&] { return started.load(); }));
    sub.unsubscribe();
    release = true;
    my_pool.wait();
    REQUIRE(counter.load() == 1);
}

TEST_CASE("cancelled delayed tasks do not hold wait()", "[thread_pool]") {
    thread_pool my_pool{2};
    auto sub = schedule(
            my_pool.scheduler(), [](shared_subscription) {}, delay_type{10s});
    sub.unsubscribe();
    auto start = std::chrono::steady_clock::now();
    my_pool.wait();
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("wait() waits for the delayed tasks", "[thread_pool]") {
    std::atomic<int> counter{0};
    thread_pool my_pool{2};
    schedule(
            my_pool.scheduler(), [&](shared_subscription) { counter++; }, delay_type{20ms});
    my_pool.wait();
    REQUIRE(counter.load() == 1);
}

TEST_CASE("tasks can schedule other tasks", "[thread_pool]") {
    std::atomic<int> counter{0};
    thread_pool my_pool{2};
    auto sched = my_pool.scheduler();
    schedule(sched, [&](shared_subscription) {
        counter++;
        schedule(sched, [&](shared_subscription) { counter++; });
    });
    REQUIRE(bounded_wait_count(counter, 2));
}

TEST_CASE("stopped thread_pool rejects new work", "[thread_pool]") {
    thread_pool my_pool{2};
    my_pool.stop();
    shared_subscription sub;
    bool executed = false;
    try {
        sub = schedule(my_pool.scheduler(), [&](shared_subscription) { executed = true; });
        FAIL("submission_error expected");
    } catch (const submission_error& e) {
        REQUIRE(e.reason() == submission_failure::stopped);
    }
    REQUIRE_FALSE(executed);

    SECTION("the subscription of rejected work is closed") {
        auto res = make_deferred<shared_subscription>([](shared_subscription, int) {}, 0);
        REQUIRE_THROWS_AS(my_pool.scheduler().spawn(std::move(res.second), res.first),
                submission_error);
        REQUIRE(res.first.is_closed());
    }
}

TEST_CASE("stop() drops the tasks that did not start", "[thread_pool]") {
    std::atomic<int> counter{0};
    thread_pool my_pool{2};
    auto sub = schedule(
            my_pool.scheduler(), [&](shared_subscription) { counter++; }, delay_type{50ms});
    my_pool.stop();
    REQUIRE(sub.is_closed());
    std::this_thread::sleep_for(100ms);
    REQUIRE(counter.load() == 0);
}

TEST_CASE("stop() closes the subscriptions of the ready tasks it drops", "[thread_pool]") {
    std::atomic<bool> release{false};
    std::atomic<bool> blocker_started{false};
    std::atomic<int> counter{0};
    thread_pool my_pool{1};
    auto sched = my_pool.scheduler();
    auto blocker = schedule(sched, [&](shared_subscription) {
        blocker_started = true;
        bounded_wait([&] { return release.load(); });
    });
    REQUIRE(bounded_wait([&] { return blocker_started.load(); }));

    auto sub = schedule(sched, [&](shared_subscription) { counter++; });
    my_pool.stop();
    REQUIRE(sub.is_closed());
    // The running task is not affected
    REQUIRE_FALSE(blocker.is_closed());
    release = true;
    my_pool.wait();
    REQUIRE(counter.load() == 0);
}

TEST_CASE("completed tasks keep their subscription open", "[thread_pool]") {
    thread_pool my_pool{2};
    auto sub = schedule(my_pool.scheduler(), [](shared_subscription) {});
    my_pool.wait();
    REQUIRE_FALSE(sub.is_closed());
}

TEST_CASE("thread_pool rejects work when saturated", "[thread_pool]") {
    pool_config config;
    config.num_workers_ = 1;
    config.max_pending_ = 2;
    thread_pool my_pool{config};
    auto sched = my_pool.scheduler();

    std::atomic<bool> release{false};
    std::atomic<bool> blocker_started{false};
    schedule(sched, [&](shared_subscription) {
        blocker_started = true;
        bounded_wait([&] { return release.load(); });
    });
    REQUIRE(bounded_wait([&] { return blocker_started.load(); }));

    std::atomic<int> counter{0};
    schedule(sched, [&](shared_subscription) { counter++; });
    schedule(sched, [&](shared_subscription) { counter++; });

    auto res = make_deferred<shared_subscription>([&](shared_subscription, int) { counter++; }, 0);
    try {
        sched.spawn(std::move(res.second), res.first);
        FAIL("submission_error expected");
    } catch (const submission_error& e) {
        REQUIRE(e.reason() == submission_failure::saturated);
    }
    REQUIRE(res.first.is_closed());

    release = true;
    my_pool.wait();
    REQUIRE(counter.load() == 2);
}

TEST_CASE("exceptions from tasks are passed to the except function", "[thread_pool]") {
    std::atomic<int> num_exceptions{0};
    pool_config config;
    config.num_workers_ = 2;
    config.except_fun_ = [&](std::exception_ptr ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::runtime_error&) {
            num_exceptions++;
        }
    };
    thread_pool my_pool{config};
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; i++)
        schedule(my_pool.scheduler(), [&](shared_subscription) {
            counter++;
            throw std::runtime_error("test");
        });
    my_pool.wait();
    REQUIRE(counter.load() == 10);
    REQUIRE(num_exceptions.load() == 10);
}

TEST_CASE("cannot wait on a thread_pool from one of its tasks", "[thread_pool]") {
    std::atomic<bool> thrown{false};
    thread_pool my_pool{1};
    schedule(my_pool.scheduler(), [&](shared_subscription) {
        try {
            my_pool.wait();
        } catch (const std::logic_error&) {
            thrown = true;
        }
    });
    REQUIRE(bounded_wait([&] { return thrown.load(); }));
}
