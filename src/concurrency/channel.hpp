#pragma once


#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <stop_token>
#include "errors.hpp"

namespace concurrency {

    template<class T>
    struct Result {
        T answer;
        bool ok;
    };


    /**
     * Channel is a closable, unbounded, multi-producer multi-consumer queue.
     * Readers block until an element arrives or the channel is closed and drained.
     */
    template<class T>
    class Channel {
    private:

        bool closed = false;
        std::queue<T> q;
        mutable std::mutex m;
        std::condition_variable_any c;

        /**
         * USAGE: should be called when channel resources are locked!
         * always drains the channel before reporting it is closed.
         */
        inline Result<T> pop_chan() {
            if (!q.empty()) {
                Result<T> out{std::move(q.front()), true};
                q.pop();
                return out;
            }
            if (closed) {
                return Result<T>{T(), false};
            } // result is not OK.

            throw std::runtime_error("Channel::pop_chan() - unexpected state.");
        }

    public:
        Channel() : q(), m(), c() {}

        ~Channel() {
            close();
        }

        // not allowing copy or moving of a channel.
        Channel(const Channel &) = delete;

        Channel(Channel &&) = delete;


        /**
         * Adds an element to the queue.
         * @throws std::runtime_error if the channel was closed.
         */
        void write(T &&t) {
            {
                std::lock_guard<std::mutex> lock(m);
                if (closed) {
                    throw std::runtime_error("Channel::write() - channel closed.");
                }
                q.push(std::move(t));
            }
            c.notify_all();
        }

        /**
         * Get the "front"-element.
         * If there is nothing to read from the channel, wait till an element was written on another thread.
         * @throws Cancelled if st was stopped while the channel was empty and open.
         */
        Result<T> read(std::stop_token st = {}) {
            std::unique_lock<std::mutex> lock(m);
            if (!c.wait(lock, st, [&] { return (!q.empty() || closed); })) {
                throw Cancelled("Channel::read() - cancelled.");
            }

            return pop_chan();
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> lock(m);
            return q.size();
        }

        /**
         * Closes the channel, anyone attempting to read from a closed channel should quickly receive read failure
         * once the remaining elements were drained.
         */
        void close() {
            {
                std::lock_guard<std::mutex> lock(m);
                closed = true;
            }
            c.notify_all();
        }

    };
}
