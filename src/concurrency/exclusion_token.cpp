#include "exclusion_token.hpp"
#include "errors.hpp"

namespace concurrency {

    void ExclusionToken::acquire(std::stop_token st) {
        std::unique_lock<std::mutex> lock(m);
        if (!cv.wait(lock, st, [this] { return !held; })) {
            throw Cancelled("ExclusionToken::acquire: cancelled while waiting for the token");
        }
        held = true;
    }

    void ExclusionToken::release() {
        {
            std::lock_guard<std::mutex> lock(m);
            held = false;
        }
        cv.notify_all();
    }
}
