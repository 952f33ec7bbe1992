#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/generic/async_generic_service.h>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include "streamgate.pb.h"
#include "marshal/marshal.hpp"
#include "streams/stream_sink.hpp"

namespace services {

    /**
     * ElementStream is the server side of a single subscription: a gRPC callback reactor that carries at most one
     * write at a time, and exposes itself as a StreamSink for a FlowControlledWriter.
     *
     * It is ready whenever no write is in flight. Once the stream broke or ended it also reports ready, so blocked
     * producers get to write() and fail fast instead of waiting forever.
     *
     * The reactor keeps itself alive until gRPC calls OnDone.
     */
    class ElementStream final : public grpc::ServerGenericBidiReactor,
                                public streams::StreamSink<streamgate::StreamElement> {
        std::mutex mtx;
        std::condition_variable write_done;
        bool mid_write = false; // a StartWrite wasn't acknowledged yet.
        bool finish_requested = false;
        bool finish_sent = false;
        bool broken = false; // a write failed or the call was cancelled.
        bool done = false;
        grpc::Status final_status;

        std::string subscriber;
        std::shared_ptr<marshal::Marshaller> mrshl;

        // the element currently written, must stay alive until OnWriteDone.
        grpc::ByteBuffer out_buf;
        // subscribers aren't expected to send anything, reads only detect half-close.
        grpc::ByteBuffer in_buf;

        std::function<void()> ready_listener;
        std::shared_ptr<ElementStream> self;

        ElementStream(std::string subscriber, std::shared_ptr<marshal::Marshaller> mrshl);

        void request_finish(grpc::Status status);

        void notify_ready();

        // The following are calls done by gRPC.
        void OnWriteDone(bool ok) override;

        void OnReadDone(bool ok) override;

        void OnCancel() override;

        void OnDone() override;

    public:
        static std::shared_ptr<ElementStream>
        Create(std::string subscriber, std::shared_ptr<marshal::Marshaller> mrshl);

        // called (on a gRPC thread) every time the stream may have become ready.
        void on_ready(std::function<void()> listener);

        bool is_ready() override;

        /**
         * Starts an asynchronous write, waiting first for a write still in flight.
         * @throws streams::TransportFailure if the stream was finished, cancelled or a previous write failed.
         */
        void write(const streamgate::StreamElement &element) override;

        void complete() override;

        void fail(const std::string &reason) override;
    };
}
