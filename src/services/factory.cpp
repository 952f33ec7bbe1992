#include "factory.hpp"
#include "constants.hpp"
#include "streams/configurations.hpp"
#include <google/protobuf/util/json_util.h>
#include <fstream>
#include <stdexcept>

streamgate::AppConfigs
services::configurations::create_app_configs(const std::string &server_hostname,
                                             const streamgate::WriterConfigs &writer_configs,
                                             std::uint32_t number_of_producers,
                                             std::uint64_t elements_per_producer,
                                             std::uint64_t payload_size) {
    streamgate::AppConfigs c;
    c.mutable_server_hostname()->assign(server_hostname);
    c.mutable_writer_configs()->CopyFrom(writer_configs);
    c.set_number_of_producers(number_of_producers);
    c.set_elements_per_producer(elements_per_producer);
    c.set_payload_size(payload_size);
    return c;
}

streamgate::AppConfigs services::configurations::load_app_configs(const std::filesystem::path &filename) {
    std::ifstream ifs(filename);
    if (!ifs.is_open()) {
        throw std::invalid_argument("app config file " + filename.string() + " could not be opened");
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        (std::istreambuf_iterator<char>()));
    ifs.close();

    streamgate::AppConfigs c;
    auto status = google::protobuf::util::JsonStringToMessage(content, &c);
    if (!status.ok()) {
        throw std::invalid_argument("app config file " + filename.string() + " is malformed: " + status.ToString());
    }

    auto defaults = streams::configurations::create_writer_configs();
    if (c.writer_configs().readiness_check_interval() == 0) {
        c.mutable_writer_configs()->set_readiness_check_interval(defaults.readiness_check_interval());
    }
    if (c.writer_configs().initial_stall_wait_ms() == 0) {
        c.mutable_writer_configs()->set_initial_stall_wait_ms(defaults.initial_stall_wait_ms());
    }
    return c;
}

void services::configurations::inspect_configs(const streamgate::AppConfigs &cnfgs) {
    streams::configurations::inspect_configs(cnfgs.writer_configs());

    if (cnfgs.number_of_producers() < 1) {
        throw std::invalid_argument("number of producers must be positive");
    }
    if (cnfgs.number_of_producers() > 1024) {
        throw std::invalid_argument("number of producers must be between 1 and 1024");
    }
    // leaves room for the producer name and sequence inside a single message.
    if (cnfgs.payload_size() > std::uint64_t(constants::max_message_size) - 1024) {
        throw std::invalid_argument("payload size must fit within the max message size");
    }
}
