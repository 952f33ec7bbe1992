#include "phase_gate.hpp"
#include "errors.hpp"

namespace concurrency {

    std::uint64_t PhaseGate::current_phase() const {
        std::lock_guard<std::mutex> lock(m);
        return phase;
    }

    std::uint64_t PhaseGate::await_advance(std::uint64_t observed_phase, std::stop_token st) {
        std::unique_lock<std::mutex> lock(m);
        if (!cv.wait(lock, st, [this, observed_phase] { return phase > observed_phase; })) {
            throw Cancelled("PhaseGate::await_advance: cancelled while waiting for phase " +
                            std::to_string(observed_phase + 1));
        }
        return phase;
    }

    std::optional<std::uint64_t>
    PhaseGate::await_advance_for(std::uint64_t observed_phase, std::chrono::milliseconds timeout, std::stop_token st) {
        std::unique_lock<std::mutex> lock(m);
        if (cv.wait_for(lock, st, timeout, [this, observed_phase] { return phase > observed_phase; })) {
            return phase;
        }
        if (st.stop_requested()) {
            throw Cancelled("PhaseGate::await_advance_for: cancelled while waiting for phase " +
                            std::to_string(observed_phase + 1));
        }
        return std::nullopt;
    }

    std::uint64_t PhaseGate::advance() {
        std::lock_guard<std::mutex> lock(m);
        phase += 1;
        cv.notify_all();
        return phase;
    }
}
