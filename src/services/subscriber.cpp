#include "subscriber.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <iostream>

namespace services {

    Subscriber::Subscriber(const std::string &server_address, std::string name)
        : name(std::move(name)), mrshl(marshal::Marshaller::Create(constants::max_message_size)), chan() {
        grpc::ChannelArguments ch_args;
        ch_args.SetMaxReceiveMessageSize(constants::max_message_size);
        ch_args.SetMaxSendMessageSize(constants::max_message_size);
        stub = std::make_unique<grpc::GenericStub>(
            grpc::CreateCustomChannel(
                server_address,
                grpc::InsecureChannelCredentials(),
                ch_args
            )
        );

        utils::add_metadata_string(context_, constants::subscriber_md, this->name);
        stub->PrepareBidiStreamingCall(&context_, std::string(constants::subscribe_method), grpc::StubOptions(), this);

        StartRead(&read_val);
        // a subscriber only listens.
        StartWritesDone();
        StartCall();
    }

    Subscriber::~Subscriber() {
        cancel();
        wait_for_stream_termination();
    }

    void Subscriber::OnReadDone(bool ok) {
        if (!ok) {
            // the stream ended, OnDone will follow with the status.
            return;
        }

        try {
            chan.write(mrshl->unmarshal_message<streamgate::StreamElement>(read_val));
        } catch (std::exception &e) {
            std::cerr << "Subscriber::OnReadDone: failure: " << e.what() << std::endl;
        }

        StartRead(&read_val);// queue the next read request.
    }

    void Subscriber::OnDone(const grpc::Status &s) {
        if (!s.ok()) {
            std::cerr << "Subscriber::OnDone: " << name << " stream ended with " << s.error_code() << ": "
                      << s.error_message() << std::endl;
        }
        chan.close();

        std::unique_lock<std::mutex> l(mu_);
        status_ = s;
        done_ = true;
        cv_.notify_all();
    }

    concurrency::Result<streamgate::StreamElement> Subscriber::next_element(std::stop_token st) {
        return chan.read(std::move(st));
    }

    grpc::Status Subscriber::wait_for_stream_termination() {
        std::unique_lock<std::mutex> l(mu_);
        cv_.wait(l, [this] { return done_; });
        return status_;
    }

    void Subscriber::cancel() {
        context_.TryCancel();
    }
}
