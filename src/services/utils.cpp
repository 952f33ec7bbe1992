#include "utils.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace services::utils {

    void add_metadata_string(grpc::ClientContext &context, const services::constants::metadata &md,
                             const std::string &str) {
        context.AddMetadata(std::string(md), str);
    }

    std::string extract_string_from_metadata(const std::multimap<grpc::string_ref, grpc::string_ref> &mp,
                                             const services::constants::metadata &md) {
        auto it = mp.find(grpc::string_ref(md.data(), md.size()));
        if (it == mp.end()) {
            return "";
        }
        return {it->second.data(), it->second.size()};
    }

    const std::string ipv4("ipv4:");
    const std::string ipv6("ipv6:");

    char from_hex(char ch) {
        auto c = static_cast<unsigned char>(ch);
        return std::isdigit(c) ? char(c - '0') : char(std::tolower(c) - 'a' + 10);
    }

    // gRPC percent-encodes ipv6 peers, e.g. "ipv6:%5B::1%5D:5051".
    std::string url_decode(const std::string &text) {
        std::ostringstream decoded;
        for (auto i = text.begin(), end = text.end(); i != end; ++i) {
            if (*i != '%') {
                decoded << *i;
                continue;
            }
            if (i + 1 == end || i + 2 == end) {
                break;
            }
            decoded << char(from_hex(i[1]) << 4 | from_hex(i[2]));
            i += 2;
        }
        return decoded.str();
    }

    std::string extract_ip(const grpc::ServerContextBase *pContext) {
        return extract_ip(pContext->peer());
    }

    std::string extract_ip(std::string peer) {
        if (peer.find(ipv4) != std::string::npos) {
            peer.erase(0, peer.find(ipv4) + ipv4.length());
            return peer.substr(0, peer.find(':'));
        }

        if (peer.find(ipv6) == std::string::npos) {
            return peer; // unix sockets, in-process channels.
        }

        peer = url_decode(peer);
        peer.erase(0, peer.find(ipv6) + ipv6.length());
        if (peer.find(']') != std::string::npos) {
            peer.erase(peer.find(']'), peer.length());
            peer.erase(0, peer.find('[') + 1);
        }
        return peer;
    }

    std::optional<int> parse_non_negative_int(const std::string &str) {
        try {
            std::size_t parsed = 0;
            auto value = std::stoi(str, &parsed);
            if (parsed != str.size() || value < 0) {
                return std::nullopt;
            }
            return value;
        } catch (std::logic_error &e) { // std::invalid_argument, std::out_of_range.
            return std::nullopt;
        }
    }
}
