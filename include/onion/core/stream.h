#pragma once

#include "onion/core/transport.h"

#include <boost/asio/any_io_executor.hpp>

#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace onion::core {

// Source of body bytes that are produced asynchronously.
class ReadableStream {
public:
    // An empty chunk without an error marks the end of the stream.
    using ReadHandler = std::function<void(std::exception_ptr, std::string)>;

    virtual ~ReadableStream() = default;

    virtual void read(ReadHandler handler) = 0;

    // Stop producing; called when the consumer went away.
    virtual void destroy() {}
};

using ReadableStreamPtr = std::shared_ptr<ReadableStream>;

class MemoryStream : public ReadableStream {
public:
    explicit MemoryStream(std::vector<std::string> chunks);

    // Every read completes through `executor` instead of inline.
    MemoryStream(boost::asio::any_io_executor executor, std::vector<std::string> chunks);

    // Deliver `error` instead of end-of-stream once the chunks ran out.
    void fail_at_end(std::exception_ptr error);

    void read(ReadHandler handler) override;
    void destroy() override;

    bool destroyed() const noexcept;

private:
    std::optional<boost::asio::any_io_executor> executor_;
    std::deque<std::string> chunks_;
    std::exception_ptr error_;
    bool destroyed_ = false;
};

// Copies `stream` into `out` and ends `out` at end of stream. Read errors go
// to `on_error`; write errors are left to the transport's finish handlers.
void pipe(ReadableStreamPtr stream,
          std::shared_ptr<OutgoingMessage> out,
          std::function<void(std::exception_ptr)> on_error);

} // namespace onion::core
