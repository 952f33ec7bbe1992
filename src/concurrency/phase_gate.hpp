#pragma once

#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>

namespace concurrency {

    /**
     * PhaseGate lets threads block until a controller advances a generation counter.
     * A waiter should read current_phase() BEFORE checking the condition it waits on, then pass that value to
     * await_advance. Any advance made after the capture releases it, even one that lands before the wait begins.
     */
    class PhaseGate {

    private:
        mutable std::mutex m;
        std::condition_variable_any cv;
        std::uint64_t phase = 0;
    public:
        PhaseGate() : m(), cv() {}

        // not allowing move or copy.
        PhaseGate(const PhaseGate &) = delete;

        PhaseGate(PhaseGate &&) = delete;

        std::uint64_t current_phase() const;

        /**
         * Blocks until the phase is strictly greater than observed_phase.
         * @return the phase seen on release.
         * @throws Cancelled if stop was requested on st before the phase moved past observed_phase.
         */
        std::uint64_t await_advance(std::uint64_t observed_phase, std::stop_token st = {});

        /**
         * Same as await_advance, but gives up after timeout.
         * @return the new phase, or std::nullopt if the timeout expired first.
         */
        std::optional<std::uint64_t>
        await_advance_for(std::uint64_t observed_phase, std::chrono::milliseconds timeout, std::stop_token st = {});

        // moves to the next phase and releases every waiter. returns the new phase.
        std::uint64_t advance();
    };

}
