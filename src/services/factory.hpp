#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "streamgate.pb.h"


namespace services::configurations {

    streamgate::AppConfigs
    create_app_configs(const std::string &server_hostname, const streamgate::WriterConfigs &writer_configs,
                       std::uint32_t number_of_producers, std::uint64_t elements_per_producer,
                       std::uint64_t payload_size);

    /**
     * Reads AppConfigs from a json file, e.g:
     * {"serverHostname": "localhost:5051", "writerConfigs": {"readinessCheckInterval": 1}, "numberOfProducers": 5}
     * unset writer configs take their defaults.
     */
    streamgate::AppConfigs load_app_configs(const std::filesystem::path &filename);

    // throws std::invalid_argument on configurations the server can't run with.
    void inspect_configs(const streamgate::AppConfigs &cnfgs);
}
