#pragma once

/**
 * @file streaming_session.hpp
 * @brief Drives one signal cursor into one stream sink
 *
 * Protocol:
 * - One data message per sample: {timestamp, value, "", seq, end_flag=false}
 * - On cursor end: one message with the last emitted sample (0.0/0.0 if
 *   none), seq = number of data messages and end_flag=true; then close()
 * - On cursor error: fail(reason), then close(); no end message
 * - If the sink refuses a message the session stops and drops the cursor
 */

#include "pltx/core/stream_sink.hpp"
#include "pltx/data/signal_cursor.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace pltx {

enum class StreamStatus {
    COMPLETED,      ///< End message delivered
    FAILED,         ///< Cursor reached its error state
    CANCELLED       ///< Sink refused a message
};

inline const char* to_string(StreamStatus status) {
    switch (status) {
        case StreamStatus::COMPLETED: return "completed";
        case StreamStatus::FAILED:    return "failed";
        case StreamStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Outcome of one stream
 */
struct StreamResult {
    StreamStatus status;
    uint64_t messages_sent;     ///< Including the end message
    uint64_t samples_sent;      ///< Data messages only
    std::string error;          ///< Failure reason (FAILED only)

    StreamResult() : status(StreamStatus::COMPLETED), messages_sent(0), samples_sent(0) {}
};

/**
 * @brief Per-stream driver
 *
 * Single use: run() consumes the cursor. Runs on the caller's thread;
 * blocks only inside cursor reads and sink sends.
 */
class StreamingSession {
public:
    StreamingSession(std::string public_name,
                     std::unique_ptr<SignalCursor> cursor,
                     IStreamSink& sink);

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    /**
     * @brief Drain the cursor into the sink
     * @throws std::logic_error if called twice
     */
    StreamResult run();

    const std::string& public_name() const { return public_name_; }

private:
    StreamResult finish(StreamResult result);

    std::string public_name_;
    std::unique_ptr<SignalCursor> cursor_;
    IStreamSink& sink_;
};

} // namespace pltx
