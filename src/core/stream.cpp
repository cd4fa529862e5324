#include "onion/core/stream.h"

#include <boost/asio/post.hpp>

namespace onion::core {

MemoryStream::MemoryStream(std::vector<std::string> chunks) {
    for (auto& chunk : chunks) {
        if (!chunk.empty()) {
            chunks_.push_back(std::move(chunk));
        }
    }
}

MemoryStream::MemoryStream(boost::asio::any_io_executor executor,
                           std::vector<std::string> chunks)
    : MemoryStream(std::move(chunks)) {
    executor_ = std::move(executor);
}

void MemoryStream::fail_at_end(std::exception_ptr error) {
    error_ = std::move(error);
}

void MemoryStream::read(ReadHandler handler) {
    std::exception_ptr error;
    std::string chunk;
    if (!destroyed_ && !chunks_.empty()) {
        chunk = std::move(chunks_.front());
        chunks_.pop_front();
    } else if (!destroyed_) {
        error = error_;
    }

    if (!executor_) {
        handler(error, std::move(chunk));
        return;
    }
    boost::asio::post(*executor_,
        [handler = std::move(handler), error, chunk = std::move(chunk)]() mutable {
            handler(error, std::move(chunk));
        });
}

void MemoryStream::destroy() {
    destroyed_ = true;
    chunks_.clear();
}

bool MemoryStream::destroyed() const noexcept {
    return destroyed_;
}

namespace {

void pump(const ReadableStreamPtr& stream,
          const std::shared_ptr<OutgoingMessage>& out,
          const std::function<void(std::exception_ptr)>& on_error) {
    stream->read([stream, out, on_error](std::exception_ptr error, std::string chunk) {
        if (error) {
            on_error(error);
            return;
        }
        if (chunk.empty()) {
            out->end();
            return;
        }
        if (!out->writable()) {
            stream->destroy();
            return;
        }
        out->write(chunk, [stream, out, on_error](boost::system::error_code ec) {
            if (ec) {
                stream->destroy();
                return;
            }
            pump(stream, out, on_error);
        });
    });
}

} // namespace

void pipe(ReadableStreamPtr stream,
          std::shared_ptr<OutgoingMessage> out,
          std::function<void(std::exception_ptr)> on_error) {
    pump(stream, out, on_error);
}

} // namespace onion::core
