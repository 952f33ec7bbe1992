#include "element_stream.hpp"
#include "streams/errors.hpp"
#include <iostream>

namespace services {

    ElementStream::ElementStream(std::string subscriber, std::shared_ptr<marshal::Marshaller> mrshl)
        : subscriber(std::move(subscriber)), mrshl(std::move(mrshl)) {}

    std::shared_ptr<ElementStream>
    ElementStream::Create(std::string subscriber, std::shared_ptr<marshal::Marshaller> mrshl) {
        auto stream = std::shared_ptr<ElementStream>(new ElementStream(std::move(subscriber), std::move(mrshl)));
        stream->self = stream;
        stream->StartRead(&stream->in_buf);
        return stream;
    }

    void ElementStream::on_ready(std::function<void()> listener) {
        std::lock_guard<std::mutex> lock(mtx);
        ready_listener = std::move(listener);
    }

    bool ElementStream::is_ready() {
        std::lock_guard<std::mutex> lock(mtx);
        return !mid_write || broken || finish_requested || done;
    }

    void ElementStream::write(const streamgate::StreamElement &element) {
        {
            std::unique_lock<std::mutex> lock(mtx);
            // readiness may have been sampled before another producer's write went out, gRPC takes one at a time.
            write_done.wait(lock, [this] { return !mid_write || broken || done; });
            if (broken || finish_requested || done) {
                throw streams::TransportFailure(
                    "ElementStream::write: stream to subscriber " + subscriber + " is no longer writable");
            }
            // out_buf is only touched by the single writer between writes.
            mrshl->marshal_message(element, out_buf);
            mid_write = true;
        }
        StartWrite(&out_buf);
    }

    void ElementStream::complete() {
        request_finish(grpc::Status::OK);
    }

    void ElementStream::fail(const std::string &reason) {
        request_finish(grpc::Status(grpc::StatusCode::ABORTED, reason));
    }

    void ElementStream::request_finish(grpc::Status status) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (finish_requested) {
                return;
            }
            finish_requested = true;
            final_status = std::move(status);

            // finishing is deferred to OnWriteDone while a write is in flight.
            if (mid_write) {
                return;
            }
            finish_sent = true;
        }
        Finish(final_status);
    }

    void ElementStream::notify_ready() {
        std::function<void()> listener;
        {
            std::lock_guard<std::mutex> lock(mtx);
            listener = ready_listener;
        }
        write_done.notify_all();
        if (listener) {
            listener();
        }
    }

    void ElementStream::OnWriteDone(bool ok) {
        if (!ok) {
            std::cerr << "ElementStream::OnWriteDone: bad write to subscriber " << subscriber << std::endl;
        }

        bool finish_now = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            mid_write = false;
            if (!ok) {
                broken = true;
            }
            if (finish_requested && !finish_sent) {
                finish_sent = true;
                finish_now = true;
            }
        }

        if (finish_now) {
            Finish(final_status);
        }
        notify_ready();
    }

    void ElementStream::OnReadDone(bool ok) {
        if (ok) {
            // ignoring anything a subscriber sends.
            StartRead(&in_buf);
        }
    }

    void ElementStream::OnCancel() {
        std::cout << "ElementStream::OnCancel: subscriber " << subscriber << " cancelled the stream" << std::endl;
        {
            std::lock_guard<std::mutex> lock(mtx);
            broken = true;
        }
        // a cancelled call still has to be finished for OnDone to arrive.
        request_finish(grpc::Status::CANCELLED);
        notify_ready();
    }

    void ElementStream::OnDone() {
        std::cout << "ElementStream::OnDone: closing stream of subscriber " << subscriber << std::endl;
        std::shared_ptr<ElementStream> keep_alive;
        {
            std::lock_guard<std::mutex> lock(mtx);
            done = true;
            keep_alive = std::move(self);
        }
        notify_ready();
        // keep_alive may drop the last reference here.
    }
}
