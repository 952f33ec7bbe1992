#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stop_token>
#include <thread>
#include "concurrency/phase_gate.hpp"
#include "concurrency/exclusion_token.hpp"
#include "configurations.hpp"
#include "errors.hpp"
#include "stream_sink.hpp"
#include "streamgate.pb.h"

namespace streams {

    /**
     * FlowControlledWriter lets any number of producer threads push elements into a single StreamSink.
     *
     * Writes are serialized through an exclusion token that is held for one sink write only.
     * A producer that finds the sink not ready blocks on a PhaseGate (outside the token) until the sink's owner
     * calls on_readiness_changed(), then samples is_ready() again.
     *
     * Every blocking call takes an optional std::stop_token; stopping it unblocks the caller with Cancelled.
     */
    template<class T>
    class FlowControlledWriter {
        std::shared_ptr<StreamSink<T>> sink;
        concurrency::PhaseGate gate;
        concurrency::ExclusionToken token;

        std::uint32_t readiness_check_interval;
        std::chrono::milliseconds initial_stall_wait;

        // written only while holding the token.
        std::atomic<bool> closed = false;
        std::atomic<std::uint64_t> num_submitted = 0;
        std::atomic<std::uint64_t> num_written = 0;

        bool should_check_readiness() {
            if (readiness_check_interval <= 1) {
                return true;
            }
            return (num_submitted.fetch_add(1) + 1) % readiness_check_interval == 0;
        }

        void throw_if_closed(const char *caller) const {
            if (closed.load()) {
                throw ClosedWriter(std::string("FlowControlledWriter::") + caller + ": writer closed");
            }
        }

        void wait_until_ready(const std::stop_token &st) {
            // the phase is captured before the first is_ready() sample, any advance after this point wakes us.
            auto phase = gate.current_phase();
            auto initial_phase = phase;

            auto wait_slice = initial_stall_wait;
            std::chrono::milliseconds stalled{0};

            while (!sink->is_ready()) {
                throw_if_closed("submit");

                auto next_phase = gate.await_advance_for(phase, wait_slice, st);
                if (next_phase.has_value()) {
                    phase = *next_phase;
                    continue;
                }

                stalled += wait_slice;
                wait_slice = configurations::next_stall_wait_slice(wait_slice);
            }

            if (stalled.count() > 0) {
                log_stall(stalled, phase == initial_phase);
            }
        }

        static void log_stall(std::chrono::milliseconds stalled, bool never_notified) {
            std::stringstream ss;
            ss << "FlowControlledWriter::submit: output stream stalled for " << stalled.count() << "ms, thread "
               << std::this_thread::get_id() << ".";
            if (never_notified) {
                ss << " no readiness notification arrived while waiting,"
                   << " make sure the transport's callback thread is not the one producing output.";
            }
            std::cerr << ss.str() << std::endl;
        }

        template<typename Fn>
        void close_with(const char *caller, Fn &&signal_sink) {
            concurrency::ExclusionToken::Holder holder(token);
            throw_if_closed(caller);
            closed.store(true);
            // producers parked on readiness must observe the closure instead of waiting forever.
            gate.advance();
            signal_sink();
        }

    public:
        FlowControlledWriter(std::shared_ptr<StreamSink<T>> sink, const streamgate::WriterConfigs &cnfgs)
            : sink(std::move(sink)), gate(), token(),
              readiness_check_interval(cnfgs.readiness_check_interval()),
              initial_stall_wait(std::chrono::milliseconds(cnfgs.initial_stall_wait_ms())) {
            if (this->sink == nullptr) {
                throw std::invalid_argument("FlowControlledWriter: sink must not be null");
            }
            configurations::inspect_configs(cnfgs);
        }

        explicit FlowControlledWriter(std::shared_ptr<StreamSink<T>> sink)
            : FlowControlledWriter(std::move(sink), configurations::create_writer_configs()) {}

        // not allowing copy or moving of a writer.
        FlowControlledWriter(const FlowControlledWriter &) = delete;

        FlowControlledWriter(FlowControlledWriter &&) = delete;

        /**
         * Writes element to the sink once the sink is ready and no other producer is writing.
         * Elements submitted sequentially by one thread reach the sink in order.
         * @throws ClosedWriter if the writer was completed or failed, before or while waiting.
         * @throws Cancelled if st was stopped while waiting for readiness or for the token. nothing was written.
         * Anything thrown by the sink's write is propagated as is.
         */
        void submit(const T &element, std::stop_token st = {}) {
            throw_if_closed("submit");

            if (should_check_readiness()) {
                wait_until_ready(st);
            }

            concurrency::ExclusionToken::Holder holder(token, st);
            throw_if_closed("submit");
            sink->write(element);
            num_written.fetch_add(1);
        }

        // to be called by the sink's owner whenever the sink may have become ready.
        void on_readiness_changed() {
            gate.advance();
        }

        /**
         * Waits for any in-flight write, signals end-of-stream to the sink and closes the writer.
         * @throws ClosedWriter if the writer was already closed.
         */
        void complete() {
            close_with("complete", [this] { sink->complete(); });
        }

        /**
         * Like complete(), but terminates the stream with an error.
         */
        void fail(const std::string &reason) {
            close_with("fail", [this, &reason] { sink->fail(reason); });
        }

        bool is_closed() const {
            return closed.load();
        }

        std::uint64_t elements_written() const {
            return num_written.load();
        }
    };

}
