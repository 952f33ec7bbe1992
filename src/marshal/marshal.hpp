#pragma once

#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>
#include <stdexcept>
#include "streamgate.pb.h"

namespace marshal {

    /**
     * Marshaller moves protobuf messages in and out of the raw grpc::ByteBuffers used by the generic streams.
     */
    class Marshaller {
        std::uint64_t max_message_size;

        explicit Marshaller(std::uint64_t max_message_size);

    public:

        static std::shared_ptr<Marshaller> Create(std::uint64_t max_message_size);

        /**
         * @throws std::length_error if the serialised message exceeds the max message size.
         * @throws std::runtime_error if protobuf failed serialising the message.
         */
        template<typename T>
        void marshal_message(const T &in, grpc::ByteBuffer &out) const {
            std::string serialised;
            if (!in.SerializeToString(&serialised)) {
                throw std::runtime_error("Marshaller::marshal_message: could not serialise " + in.GetTypeName());
            }
            bytes_to_buffer(serialised, out);
        }

        template<typename T>
        T unmarshal_message(const grpc::ByteBuffer &in) const {
            T t;
            if (!t.ParseFromString(buffer_to_bytes(in))) {
                throw std::runtime_error("Marshaller::unmarshal_message: could not parse " + t.GetTypeName());
            }
            return t;
        }

        streamgate::StreamElement
        create_element(const std::string &producer, std::uint64_t sequence, std::uint64_t payload_size) const;

    private:
        void bytes_to_buffer(const std::string &in, grpc::ByteBuffer &out) const;

        std::string buffer_to_bytes(const grpc::ByteBuffer &in) const;
    };

}
