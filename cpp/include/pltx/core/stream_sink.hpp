#pragma once

/**
 * @file stream_sink.hpp
 * @brief Delivery channel of one signal stream
 *
 * The transport implements IStreamSink for each streaming connection.
 * A sink receives data messages, then either one end message or one
 * failure, and is closed exactly once.
 */

#include "pltx/core/types.hpp"
#include <string>
#include <utility>

namespace pltx {

/**
 * @brief Abstract per-stream channel
 */
class IStreamSink {
public:
    virtual ~IStreamSink() = default;

    /**
     * @brief Deliver one message
     * @return false if the consumer is gone; the stream stops
     */
    virtual bool send(const StreamMessage& message) = 0;

    /// Signal a stream failure (never followed by an end message)
    virtual void fail(const std::string& reason) = 0;

    /// Close the channel
    virtual void close() = 0;
};

/**
 * @brief Sink forwarding to std::function callbacks
 */
class CallbackSink : public IStreamSink {
public:
    CallbackSink(MessageCallback on_message, ErrorCallback on_error = nullptr)
        : on_message_(std::move(on_message))
        , on_error_(std::move(on_error)) {}

    bool send(const StreamMessage& message) override {
        if (closed_) {
            return false;
        }
        if (on_message_) {
            on_message_(message);
        }
        return true;
    }

    void fail(const std::string& reason) override {
        if (on_error_) {
            on_error_(reason);
        }
    }

    void close() override { closed_ = true; }

    bool closed() const { return closed_; }

private:
    MessageCallback on_message_;
    ErrorCallback on_error_;
    bool closed_ = false;
};

} // namespace pltx
