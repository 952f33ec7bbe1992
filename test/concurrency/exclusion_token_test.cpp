#include "../test_utils.hpp"
#include "concurrency/exclusion_token.hpp"
#include "concurrency/errors.hpp"
#include <cassert>
#include <iostream>

namespace {
    void single_holder() {
        concurrency::ExclusionToken token;
        std::atomic<bool> in_critical_section = false;
        std::atomic<int> entries = 0;

        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&]() {
                for (int j = 0; j < 1000; ++j) {
                    concurrency::ExclusionToken::Holder holder(token);
                    assert(!in_critical_section.exchange(true));
                    entries += 1;
                    assert(in_critical_section.exchange(false));
                }
            });
        }
        for (auto &t: threads) {
            t.join();
        }
        assert(entries.load() == 8 * 1000);
    }

    void cancelled_acquire() {
        concurrency::ExclusionToken token;
        std::atomic<bool> cancelled = false;
        std::atomic<bool> acquired = false;

        token.acquire();
        std::jthread contender([&](std::stop_token st) {
            try {
                concurrency::ExclusionToken::Holder holder(token, st);
                acquired.store(true);
            } catch (concurrency::Cancelled &e) {
                cancelled.store(true);
            }
        });

        TestUtils::sleep_ms(20);
        contender.request_stop();
        contender.join();
        assert(cancelled.load());
        assert(!acquired.load());

        // the abandoned acquisition left the token with its holder.
        token.release();
        concurrency::ExclusionToken::Holder holder(token);
    }

    void waiter_gets_token_on_release() {
        concurrency::ExclusionToken token;
        std::atomic<bool> acquired = false;

        token.acquire();
        std::thread waiter([&]() {
            concurrency::ExclusionToken::Holder holder(token);
            acquired.store(true);
        });

        TestUtils::sleep_ms(20);
        assert(!acquired.load());
        token.release();
        waiter.join();
        assert(acquired.load());
    }
}

int exclusion_token_test(int, char *[]) {
    single_holder();
    cancelled_acquire();
    waiter_gets_token_on_release();

    std::cout << "exclusion_token_test: ok" << std::endl;
    return 0;
}
