#include "../test_utils.hpp"
#include <cassert>
#include <iostream>

namespace {
    constexpr int num_producers = 5;
    constexpr int elements_per_producer = 10;

    void run_producers(TestUtils::StringWriter &writer) {
        std::vector<std::thread> producers;
        for (int p = 0; p < num_producers; ++p) {
            producers.emplace_back([&writer, p]() {
                for (int i = 0; i < elements_per_producer; ++i) {
                    writer.submit(std::to_string(p) + std::to_string(i));
                }
            });
        }
        for (auto &t: producers) {
            t.join();
        }
    }

    void writes_never_overlap(std::uint32_t check_interval) {
        auto sink = std::make_shared<TestUtils::TestSink>();
        std::atomic<bool> is_critical_section_shared = false;
        sink->on_write = [&](const std::string &) {
            // any other thread entering while this one sleeps trips the flag.
            assert(!is_critical_section_shared.exchange(true));
            TestUtils::sleep_ms(5);
            assert(is_critical_section_shared.exchange(false));
        };

        auto writer = TestUtils::make_writer(sink, check_interval);
        run_producers(*writer);
        writer->complete();

        auto elements = sink->elements();
        assert(elements.size() == num_producers * elements_per_producer);
        assert(writer->elements_written() == num_producers * elements_per_producer);

        auto counts = TestUtils::verify_order_per_prefix(elements, num_producers);
        for (auto count: counts) {
            assert(count == elements_per_producer);
        }
        assert(sink->num_complete_calls.load() == 1);
    }
}

int writer_thread_safety_test(int, char *[]) {
    writes_never_overlap(1);
    writes_never_overlap(3);

    std::cout << "writer_thread_safety_test: ok" << std::endl;
    return 0;
}
