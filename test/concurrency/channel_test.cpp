#include "../test_utils.hpp"
#include "concurrency/channel.hpp"
#include <cassert>
#include <iostream>

int channel_test(int, char *[]) {
    concurrency::Channel<int> chan;
    chan.write(1);
    chan.write(2);
    assert(chan.size() == 2);

    // closing drains before reporting closure.
    chan.close();
    auto r = chan.read();
    assert(r.ok && r.answer == 1);
    r = chan.read();
    assert(r.ok && r.answer == 2);
    assert(!chan.read().ok);

    bool write_failed = false;
    try {
        chan.write(3);
    } catch (std::runtime_error &e) {
        write_failed = true;
    }
    assert(write_failed);

    // a reader blocked on an empty channel can be cancelled.
    concurrency::Channel<int> empty;
    std::atomic<bool> cancelled = false;
    std::jthread reader([&](std::stop_token st) {
        try {
            empty.read(st);
        } catch (concurrency::Cancelled &e) {
            cancelled.store(true);
        }
    });
    TestUtils::sleep_ms(20);
    reader.request_stop();
    reader.join();
    assert(cancelled.load());

    // and one blocked reader receives a later write.
    std::thread consumer([&]() {
        auto v = empty.read();
        assert(v.ok && v.answer == 42);
    });
    TestUtils::sleep_ms(20);
    empty.write(42);
    consumer.join();

    std::cout << "channel_test: ok" << std::endl;
    return 0;
}
