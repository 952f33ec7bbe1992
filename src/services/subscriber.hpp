#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/generic/generic_stub.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include "streamgate.pb.h"
#include "concurrency/channel.hpp"
#include "marshal/marshal.hpp"

namespace services {

    /**
     * Subscriber is a client-reactor. upon construction it subscribes to a StreamService and delivers every received
     * element on a channel, which is closed once the stream terminates.
     */
    class Subscriber final : public grpc::ClientBidiReactor<grpc::ByteBuffer, grpc::ByteBuffer> {
        std::string name;
        std::shared_ptr<marshal::Marshaller> mrshl;
        concurrency::Channel<streamgate::StreamElement> chan;

        // Stream-Reader Properties:
        std::unique_ptr<grpc::GenericStub> stub;
        grpc::ClientContext context_;
        grpc::ByteBuffer read_val;
        std::mutex mu_;
        std::condition_variable cv_;
        grpc::Status status_;
        bool done_ = false;

        // The following are calls done by gRPC.
        void OnReadDone(bool ok) override;

        void OnDone(const grpc::Status &s) override;

    public:
        Subscriber(const std::string &server_address, std::string name);

        // cancels the stream if it is still running and waits for it to terminate.
        ~Subscriber() override;

        Subscriber(const Subscriber &) = delete;

        Subscriber &operator=(const Subscriber &) = delete;

        /**
         * Blocks until the next element arrives. result is not ok once the stream ended and all elements were read.
         */
        concurrency::Result<streamgate::StreamElement> next_element(std::stop_token st = {});

        grpc::Status wait_for_stream_termination();

        void cancel();
    };
}
