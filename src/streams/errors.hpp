#pragma once

#include <stdexcept>
#include <string>
#include "concurrency/errors.hpp"

namespace streams {

    // submit/complete/fail called on a writer that was already completed or failed.
    class ClosedWriter : public std::runtime_error {
    public:
        explicit ClosedWriter(const std::string &what) : std::runtime_error(what) {}
    };

    // the sink could not carry out a write.
    class TransportFailure : public std::runtime_error {
    public:
        explicit TransportFailure(const std::string &what) : std::runtime_error(what) {}
    };

    using Cancelled = concurrency::Cancelled;
}
