#pragma once

#include <stdexcept>
#include <string>

namespace concurrency {

    // thrown by a blocking call whose stop_token was triggered while it waited.
    class Cancelled : public std::runtime_error {
    public:
        explicit Cancelled(const std::string &what) : std::runtime_error(what) {}
    };

}
