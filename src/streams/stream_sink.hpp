#pragma once

#include <string>

namespace streams {

    /**
     * StreamSink is the outbound end of a stream, as seen by a FlowControlledWriter.
     *
     * is_ready() must be non-blocking and callable from any thread.
     * write/complete/fail are never called concurrently by a FlowControlledWriter.
     * The owner of the sink is expected to call FlowControlledWriter::on_readiness_changed whenever
     * is_ready() turns from false to true.
     */
    template<class T>
    class StreamSink {
    public:
        virtual ~StreamSink() = default;

        virtual bool is_ready() = 0;

        // may block briefly. failures are reported by throwing.
        virtual void write(const T &element) = 0;

        // end-of-stream. idempotent.
        virtual void complete() = 0;

        // terminates the stream with an error. idempotent.
        virtual void fail(const std::string &reason) = 0;
    };
}
