#pragma once

#include <mutex>
#include <condition_variable>
#include <stop_token>

namespace concurrency {

    /**
     * ExclusionToken is a mutual exclusion lock whose acquisition can be abandoned through a std::stop_token.
     * At most one holder at a time. No fairness between waiters.
     */
    class ExclusionToken {
    private:
        std::mutex m;
        std::condition_variable_any cv;
        bool held = false;

    public:
        ExclusionToken() : m(), cv() {}

        // not allowing move or copy.
        ExclusionToken(const ExclusionToken &) = delete;

        ExclusionToken(ExclusionToken &&) = delete;

        /**
         * Blocks until the token is held exclusively by the caller.
         * @throws Cancelled if stop was requested on st before the token was acquired.
         */
        void acquire(std::stop_token st = {});

        void release();

        // RAII ownership of the token for a single scope.
        class Holder {
            ExclusionToken &token;
        public:
            explicit Holder(ExclusionToken &tkn, std::stop_token st = {}) : token(tkn) {
                token.acquire(std::move(st));
            }

            ~Holder() { token.release(); }

            Holder(const Holder &) = delete;

            Holder &operator=(const Holder &) = delete;
        };
    };

}
