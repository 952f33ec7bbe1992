#include "../test_utils.hpp"
#include "streams/errors.hpp"
#include <cassert>
#include <iostream>
#include <latch>

namespace {
    void cancel_while_waiting_for_readiness() {
        auto sink = std::make_shared<TestUtils::TestSink>();
        sink->ready = [] { return false; };
        auto writer = TestUtils::make_writer(sink);

        std::atomic<bool> cancelled = false;
        std::jthread producer([&](std::stop_token st) {
            try {
                writer->submit("00", st);
            } catch (streams::Cancelled &e) {
                cancelled.store(true);
            }
        });

        TestUtils::sleep_ms(30);
        auto start = std::chrono::steady_clock::now();
        producer.request_stop();
        producer.join();

        assert(cancelled.load());
        assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
        assert(sink->num_write_calls.load() == 0);
        assert(!writer->is_closed());
    }

    void cancel_while_waiting_for_token() {
        auto sink = std::make_shared<TestUtils::TestSink>();
        std::latch release_first_write(1);
        std::atomic<bool> first_write_started = false;
        sink->on_write = [&](const std::string &e) {
            if (e == "00") {
                first_write_started.store(true);
                release_first_write.wait();
            }
        };
        auto writer = TestUtils::make_writer(sink);

        std::thread holder([&]() { writer->submit("00"); });
        assert(TestUtils::wait_until([&] { return first_write_started.load(); }));

        std::atomic<bool> cancelled = false;
        std::jthread contender([&](std::stop_token st) {
            try {
                writer->submit("10", st);
            } catch (streams::Cancelled &e) {
                cancelled.store(true);
            }
        });

        TestUtils::sleep_ms(30);
        contender.request_stop();
        contender.join();
        assert(cancelled.load());

        release_first_write.count_down();
        holder.join();

        auto elements = sink->elements();
        assert(elements.size() == 1 && elements[0] == "00");
        writer->complete();
    }

    void stopped_token_fails_before_waiting() {
        auto sink = std::make_shared<TestUtils::TestSink>();
        sink->ready = [] { return false; };
        auto writer = TestUtils::make_writer(sink);

        std::stop_source source;
        source.request_stop();
        bool cancelled = false;
        try {
            writer->submit("00", source.get_token());
        } catch (streams::Cancelled &e) {
            cancelled = true;
        }
        assert(cancelled);
        assert(sink->num_write_calls.load() == 0);
    }
}

int writer_cancellation_test(int, char *[]) {
    cancel_while_waiting_for_readiness();
    cancel_while_waiting_for_token();
    stopped_token_fails_before_waiting();

    std::cout << "writer_cancellation_test: ok" << std::endl;
    return 0;
}
