#pragma once

#include "constants.hpp"
#include <grpcpp/grpcpp.h>
#include <map>
#include <optional>
#include <string>


namespace services::utils {
    void
    add_metadata_string(grpc::ClientContext &context, const services::constants::metadata &md, const std::string &str);

    // returns an empty string if the client didn't send md.
    std::string extract_string_from_metadata(const std::multimap<grpc::string_ref, grpc::string_ref> &mp,
                                             const services::constants::metadata &md);

    std::string extract_ip(const grpc::ServerContextBase *pContext);

    std::string extract_ip(std::string peer);

    // empty unless str is a whole, non-negative int.
    std::optional<int> parse_non_negative_int(const std::string &str);
}
