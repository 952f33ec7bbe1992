#include <iostream>
#include <map>
#include "services/subscriber.hpp"


bool is_valid_command_line_args(int argc, char *argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <server_hostname:port>" << " <subscriber_name>" << std::endl;
        return false;
    }

    if (std::string(argv[1]).find(':') == std::string::npos) {
        std::cout << "server address " << argv[1] << " is missing a port" << std::endl;
        return false;
    }

    return true;
}

int main(int argc, char *argv[]) {
    if (!is_valid_command_line_args(argc, argv)) {
        return -1;
    }
    auto server_address = std::string(argv[1]);
    auto name = std::string(argv[2]);

    auto time_s = std::chrono::high_resolution_clock::now();
    services::Subscriber subscriber(server_address, name);

    // next expected sequence number per producer.
    std::map<std::string, std::uint64_t> next_sequence;
    std::uint64_t total = 0;
    std::uint64_t out_of_order = 0;
    for (;;) {
        auto element = subscriber.next_element();
        if (!element.ok) {
            break;
        }
        total += 1;

        auto &expected = next_sequence[element.answer.producer()];
        if (element.answer.sequence() != expected) {
            std::cerr << "out of order element from " << element.answer.producer() << ": expected " << expected
                      << " received " << element.answer.sequence() << std::endl;
            out_of_order += 1;
        }
        expected = element.answer.sequence() + 1;
    }

    auto status = subscriber.wait_for_stream_termination();
    auto time_e = std::chrono::high_resolution_clock::now();

    std::cout << "received " << total << " elements from " << next_sequence.size() << " producers in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(time_e - time_s).count() << " ms" << std::endl;
    for (const auto &[producer, count]: next_sequence) {
        std::cout << "  " << producer << ": " << count << std::endl;
    }

    if (!status.ok()) {
        std::cout << "terminated stream, result:" << status.error_message() << std::endl;
        return -1;
    }
    if (out_of_order > 0) {
        std::cout << out_of_order << " elements arrived out of order" << std::endl;
        return -1;
    }
    std::cout << "done." << std::endl;
    return 0;
}
