/**
 * @file streaming_session.cpp
 * @brief Implementation of the per-stream protocol driver
 */

#include "pltx/core/streaming_session.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace pltx {

StreamingSession::StreamingSession(std::string public_name,
                                   std::unique_ptr<SignalCursor> cursor,
                                   IStreamSink& sink)
    : public_name_(std::move(public_name))
    , cursor_(std::move(cursor))
    , sink_(sink) {}

StreamResult StreamingSession::run() {
    if (!cursor_) {
        throw std::logic_error("Stream '" + public_name_ + "' already ran");
    }

    StreamResult result;
    Sample sample;
    Sample last;
    uint64_t seq = 0;
    CursorState state;

    while ((state = cursor_->next(sample, seq)) == CursorState::SAMPLE) {
        if (!sink_.send(StreamMessage(sample.timestamp, sample.value, seq, false))) {
            result.status = StreamStatus::CANCELLED;
            return finish(std::move(result));
        }
        last = sample;
        ++result.messages_sent;
        ++result.samples_sent;
    }

    if (state == CursorState::ERROR) {
        result.status = StreamStatus::FAILED;
        result.error = cursor_->error_message();
        std::cerr << "[Stream] '" << public_name_ << "' failed after "
                  << result.samples_sent << " samples: " << result.error << std::endl;
        sink_.fail(result.error);
        sink_.close();
        return finish(std::move(result));
    }

    if (!sink_.send(StreamMessage(last.timestamp, last.value, result.samples_sent, true))) {
        result.status = StreamStatus::CANCELLED;
        return finish(std::move(result));
    }
    ++result.messages_sent;
    sink_.close();

    result.status = StreamStatus::COMPLETED;
    return finish(std::move(result));
}

StreamResult StreamingSession::finish(StreamResult result) {
    // Dropping the cursor releases its buffer and its reader reference
    cursor_.reset();

    if (result.status != StreamStatus::FAILED) {
        std::cout << "[Stream] '" << public_name_ << "' " << to_string(result.status)
                  << " (" << result.samples_sent << " samples)" << std::endl;
    }
    return result;
}

} // namespace pltx
