#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/generic/async_generic_service.h>
#include <memory>
#include <string>
#include "streamgate.pb.h"
#include "concurrency/channel.hpp"
#include "marshal/marshal.hpp"
#include "streams/flow_controlled_writer.hpp"

namespace services {

    typedef streams::FlowControlledWriter<streamgate::StreamElement> ElementWriter;

    struct Subscription {
        std::string subscriber;
        std::shared_ptr<ElementWriter> writer;
    };

    /**
     * StreamService accepts subscriptions on the generic callback API, and hands the application a flow-controlled
     * writer for every subscriber. The writer must eventually be completed (or failed) to end the call.
     */
    class StreamService final : public grpc::CallbackGenericService {
        streamgate::WriterConfigs writer_cnfgs;
        std::shared_ptr<marshal::Marshaller> mrshl;
        concurrency::Channel<Subscription> subscriptions;

    public:
        explicit StreamService(const streamgate::WriterConfigs &writer_cnfgs);

        grpc::ServerGenericBidiReactor *CreateReactor(grpc::GenericCallbackServerContext *ctx) override;

        /**
         * Blocks until a subscriber arrives. result is not ok once the service was closed and drained.
         * @throws concurrency::Cancelled if st was stopped while waiting.
         */
        concurrency::Result<Subscription> next_subscription(std::stop_token st = {});

        // new subscribers will be rejected.
        void close();
    };
}
