#include <chrono>
#include <iostream>
#include <filesystem>
#include <thread>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "services/constants.hpp"
#include "services/factory.hpp"
#include "services/stream_service.hpp"
#include "services/utils.hpp"
#include "marshal/marshal.hpp"


bool is_valid_command_line_args(int argc, char *argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <app_config_file>" << " <your_hostname:port_to_listen_on>"
                  << " [num_subscribers_to_serve]" << std::endl;
        return false;
    }

    if (!std::filesystem::exists(argv[1])) {
        std::cout << "App config file " << argv[1] << " does not exist" << std::endl;
        return false;
    }

    if (std::string(argv[2]).find(':') == std::string::npos) {
        std::cout << "listening address " << argv[2] << " is missing a port" << std::endl;
        return false;
    }

    if (argc > 3 && !services::utils::parse_non_negative_int(argv[3])) {
        std::cout << "num subscribers " << argv[3] << " is invalid" << std::endl;
        return false;
    }

    return true;
}

std::string get_listening_address(const std::string &address) {
    return "0.0.0.0" + address.substr(address.find(':'), address.size());
}

// runs the configured producers against a single subscriber, then ends its stream.
void serve_subscriber(const services::Subscription &sub, const streamgate::AppConfigs &cnfgs,
                      const std::shared_ptr<marshal::Marshaller> &mrshl) {
    auto time_s = std::chrono::high_resolution_clock::now();

    std::vector<std::jthread> producers;
    producers.reserve(cnfgs.number_of_producers());
    for (std::uint32_t p = 0; p < cnfgs.number_of_producers(); ++p) {
        producers.emplace_back([&, p]() {
            auto producer_name = "producer-" + std::to_string(p);
            try {
                for (std::uint64_t i = 0; i < cnfgs.elements_per_producer(); ++i) {
                    sub.writer->submit(mrshl->create_element(producer_name, i, cnfgs.payload_size()));
                }
            } catch (std::exception &e) {
                std::cerr << "serve_subscriber: " << producer_name << " stopped writing to " << sub.subscriber
                          << ": " << e.what() << std::endl;
            }
        });
    }
    for (auto &t: producers) {
        t.join();
    }

    try {
        sub.writer->complete();
    } catch (std::exception &e) {
        std::cerr << "serve_subscriber: could not complete stream of " << sub.subscriber << ": " << e.what()
                  << std::endl;
    }

    auto time_e = std::chrono::high_resolution_clock::now();
    std::cout << "serve_subscriber: wrote " << sub.writer->elements_written() << " elements to " << sub.subscriber
              << " in " << std::chrono::duration_cast<std::chrono::milliseconds>(time_e - time_s).count() << " ms"
              << std::endl;
}

int main(int argc, char *argv[]) {
    if (!is_valid_command_line_args(argc, argv)) {
        return -1;
    }
    auto app_conf_file = argv[1];
    auto hostname = std::string(argv[2]);
    auto num_subscribers = argc > 3 ? services::utils::parse_non_negative_int(argv[3]).value() : 0;

    streamgate::AppConfigs cnfgs;
    try {
        cnfgs = services::configurations::load_app_configs(app_conf_file);
        cnfgs.mutable_server_hostname()->assign(hostname);
        services::configurations::inspect_configs(cnfgs);
    } catch (std::exception &e) {
        std::cout << "invalid app configs: " << e.what() << std::endl;
        return -1;
    }

    std::cout << "server set up with the following configs:" << std::endl;
    std::cout << cnfgs.DebugString() << std::endl;

    services::StreamService service(cnfgs.writer_configs());
    auto mrshl = marshal::Marshaller::Create(services::constants::max_message_size);

    grpc::ServerBuilder builder;
    builder.SetMaxMessageSize(services::constants::max_message_size);
    auto address = get_listening_address(hostname);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterCallbackGenericService(&service);

    auto server(builder.BuildAndStart());
    if (server == nullptr) {
        std::cout << "could not listen on address: " << address << std::endl;
        return -1;
    }
    std::cout << "stream service is online on address: " << address << std::endl;

    std::vector<std::jthread> sessions;
    for (int served = 0; num_subscribers == 0 || served < num_subscribers; ++served) {
        auto sub = service.next_subscription();
        if (!sub.ok) {
            break;
        }
        sessions.emplace_back([&cnfgs, &mrshl, s = std::move(sub.answer)]() {
            serve_subscriber(s, cnfgs, mrshl);
        });
    }

    for (auto &t: sessions) {
        t.join();
    }
    service.close();
    server->Shutdown();
    std::cout << "done." << std::endl;
}
