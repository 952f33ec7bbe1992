#include "stream_service.hpp"
#include "constants.hpp"
#include "element_stream.hpp"
#include "utils.hpp"
#include "streams/configurations.hpp"
#include <iostream>

namespace {
    // finishes a call right away.
    class RejectedStream final : public grpc::ServerGenericBidiReactor {
    public:
        explicit RejectedStream(const grpc::Status &status) { Finish(status); }

        void OnDone() override { delete this; }
    };
}

namespace services {

    StreamService::StreamService(const streamgate::WriterConfigs &writer_cnfgs)
        : writer_cnfgs(writer_cnfgs), mrshl(marshal::Marshaller::Create(constants::max_message_size)),
          subscriptions() {
        streams::configurations::inspect_configs(writer_cnfgs);
    }

    grpc::ServerGenericBidiReactor *StreamService::CreateReactor(grpc::GenericCallbackServerContext *ctx) {
        if (ctx->method() != constants::subscribe_method) {
            std::cerr << "StreamService::CreateReactor: unknown method " << ctx->method() << std::endl;
            return new RejectedStream(grpc::Status(grpc::StatusCode::UNIMPLEMENTED, "unknown method " + ctx->method()));
        }

        auto name = utils::extract_string_from_metadata(ctx->client_metadata(), constants::subscriber_md);
        if (name.empty()) {
            name = utils::extract_ip(ctx);
        }

        auto stream = ElementStream::Create(name, mrshl);
        auto writer = std::make_shared<ElementWriter>(stream, writer_cnfgs);
        stream->on_ready([w = std::weak_ptr<ElementWriter>(writer)]() {
            if (auto ptr = w.lock()) {
                ptr->on_readiness_changed();
            }
        });

        try {
            subscriptions.write({name, writer});
        } catch (std::exception &e) {
            std::cerr << "StreamService::CreateReactor: rejecting subscriber " << name << ": " << e.what() << std::endl;
            stream->fail("service is closed");
            return stream.get();
        }

        std::cout << "StreamService::CreateReactor: new subscriber " << name << std::endl;
        return stream.get();
    }

    concurrency::Result<Subscription> StreamService::next_subscription(std::stop_token st) {
        return subscriptions.read(std::move(st));
    }

    void StreamService::close() {
        subscriptions.close();
    }
}
