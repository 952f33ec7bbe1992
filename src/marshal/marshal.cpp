#include "marshal.hpp"
#include <vector>

namespace marshal {
    Marshaller::Marshaller(std::uint64_t max_message_size) : max_message_size(max_message_size) {}

    std::shared_ptr<Marshaller> Marshaller::Create(std::uint64_t max_message_size) {
        auto marsh = Marshaller(max_message_size);
        return std::make_shared<Marshaller>(std::move(marsh));
    }

    void Marshaller::bytes_to_buffer(const std::string &in, grpc::ByteBuffer &out) const {
        if (in.size() > max_message_size) {
            throw std::length_error(
                "Marshaller: message of " + std::to_string(in.size()) + " bytes exceeds max message size of " +
                std::to_string(max_message_size));
        }
        grpc::Slice slice(in);
        out = grpc::ByteBuffer(&slice, 1);
    }

    std::string Marshaller::buffer_to_bytes(const grpc::ByteBuffer &in) const {
        if (in.Length() > max_message_size) {
            throw std::length_error(
                "Marshaller: received " + std::to_string(in.Length()) + " bytes, above max message size of " +
                std::to_string(max_message_size));
        }

        std::vector<grpc::Slice> slices;
        auto status = in.Dump(&slices);
        if (!status.ok()) {
            throw std::runtime_error("Marshaller: could not read byte buffer: " + status.error_message());
        }

        std::string out;
        out.reserve(in.Length());
        for (const auto &slice: slices) {
            out.append(reinterpret_cast<const char *>(slice.begin()), slice.size());
        }
        return out;
    }

    streamgate::StreamElement
    Marshaller::create_element(const std::string &producer, std::uint64_t sequence, std::uint64_t payload_size) const {
        streamgate::StreamElement e;
        e.set_producer(producer);
        e.set_sequence(sequence);
        e.mutable_payload()->assign(payload_size, static_cast<char>('a' + sequence % 26));
        return e;
    }
}
