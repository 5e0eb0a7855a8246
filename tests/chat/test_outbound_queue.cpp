/*
===============================================================================
 chat::OutboundQueue - Unit Tests
===============================================================================

Covered:
- FIFO order, capacity bound and Full reporting
- close() idempotence, Closed reporting, flush-after-close
- drain() snapshot semantics
- Notify hook on push and on the closing call only
===============================================================================
*/

#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "chat/OutboundQueue.h"
#include "common/test_check.hpp"

using duochat::chat::OutboundQueue;
using Result = OutboundQueue::PushResult;

void test_fifo_and_capacity() {
    std::cout << "[TEST] fifo order and capacity\n";

    OutboundQueue q{2};
    TEST_CHECK(q.capacity() == 2);
    TEST_CHECK(q.push("a") == Result::Queued);
    TEST_CHECK(q.push("b") == Result::Queued);
    TEST_CHECK(q.push("c") == Result::Full);
    TEST_CHECK(q.size() == 2);

    TEST_CHECK(q.pop() == std::string("a"));
    TEST_CHECK(q.push("c") == Result::Queued);
    TEST_CHECK(q.pop() == std::string("b"));
    TEST_CHECK(q.pop() == std::string("c"));
    TEST_CHECK(!q.pop().has_value());

    std::cout << "[TEST] OK\n";
}

void test_close_semantics() {
    std::cout << "[TEST] close is idempotent and keeps queued frames\n";

    OutboundQueue q{4};
    TEST_CHECK(q.push("one") == Result::Queued);
    TEST_CHECK(!q.closed());

    TEST_CHECK(q.close());
    TEST_CHECK(!q.close());
    TEST_CHECK(q.closed());
    TEST_CHECK(q.push("two") == Result::Closed);

    // Frames queued before close are still handed to the writer.
    TEST_CHECK(q.pop() == std::string("one"));
    TEST_CHECK(!q.pop().has_value());

    std::cout << "[TEST] OK\n";
}

void test_drain_snapshot() {
    std::cout << "[TEST] drain returns everything queued, in order\n";

    OutboundQueue q{8};
    for (const char* f : {"1", "2", "3"}) TEST_CHECK(q.push(f) == Result::Queued);

    auto all = q.drain();
    TEST_CHECK(all.size() == 3);
    TEST_CHECK(all[0] == "1" && all[1] == "2" && all[2] == "3");
    TEST_CHECK(q.size() == 0);
    TEST_CHECK(q.drain().empty());

    std::cout << "[TEST] OK\n";
}

void test_notify_hook() {
    std::cout << "[TEST] notify fires on push and on the closing call\n";

    OutboundQueue q{1};
    int notified = 0;
    q.set_notify([&] { ++notified; });

    TEST_CHECK(q.push("x") == Result::Queued);
    TEST_CHECK(notified == 1);
    TEST_CHECK(q.push("y") == Result::Full);
    TEST_CHECK(notified == 1);

    q.close();
    TEST_CHECK(notified == 2);
    q.close();
    TEST_CHECK(notified == 2);
    TEST_CHECK(q.push("z") == Result::Closed);
    TEST_CHECK(notified == 2);

    std::cout << "[TEST] OK\n";
}

void test_concurrent_producers() {
    std::cout << "[TEST] concurrent producers never exceed capacity\n";

    constexpr int kProducers = 4;
    constexpr int kPerProducer = 500;
    OutboundQueue q{1000};

    std::vector<std::thread> producers;
    std::vector<int> accepted(kProducers, 0);
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                if (q.push(std::to_string(p)) == Result::Queued) ++accepted[p];
            }
        });
    }
    for (auto& t : producers) t.join();

    int total = 0;
    for (int n : accepted) total += n;
    TEST_CHECK(total == 1000);
    TEST_CHECK(q.size() == 1000);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_fifo_and_capacity();
    test_close_semantics();
    test_drain_snapshot();
    test_notify_hook();
    test_concurrent_producers();

    std::cout << "\n[GROUP] outbound queue tests passed\n";
    return 0;
}
