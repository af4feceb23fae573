#pragma once

/**
 * @file types.hpp
 * @brief Core data types for the PLTX streaming layer
 *
 * This file defines the fundamental value types shared between the
 * reader, the signal catalog and the streaming boundary.
 */

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <functional>

namespace pltx {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief One decoded record of a signal
 */
struct Sample {
    double timestamp;   ///< Time (seconds)
    double value;       ///< Signal value

    Sample() : timestamp(0.0), value(0.0) {}
    Sample(double t, double v) : timestamp(t), value(v) {}

    bool operator==(const Sample& other) const {
        return timestamp == other.timestamp && value == other.value;
    }
    bool operator!=(const Sample& other) const { return !(*this == other); }
};

/**
 * @brief Columnar block of samples
 *
 * Used for bulk reads, so that timestamps and values can be handed
 * over as two contiguous arrays.
 */
struct SampleBlock {
    std::vector<double> timestamps;  ///< Time values
    std::vector<double> values;      ///< Signal values
    std::string signal_name;         ///< Signal identifier

    bool empty() const { return timestamps.empty(); }
    size_t size() const { return timestamps.size(); }

    void reserve(size_t n) {
        timestamps.reserve(n);
        values.reserve(n);
    }

    void push_back(const Sample& s) {
        timestamps.push_back(s.timestamp);
        values.push_back(s.value);
    }

    Sample at(size_t i) const { return Sample(timestamps.at(i), values.at(i)); }

    SampleBlock() = default;
    explicit SampleBlock(const std::string& name) : signal_name(name) {}
};

/**
 * @brief Metadata for a signal stored in a PLTX file
 *
 * Built once from the file header and index; immutable afterwards.
 */
struct SignalMetadata {
    uint32_t signal_id;             ///< Id inside the file
    std::string name;               ///< Signal name (unique only per file)
    std::string unit;               ///< Physical unit (e.g., "V", "A")
    std::string description;        ///< Human-readable description
    std::string source;             ///< Source tag of the recorder
    uint64_t total_samples;         ///< Sum of all chunk sample counts
    uint32_t chunk_count;           ///< Number of chunks
    double start_time;              ///< Start of first chunk (seconds)
    double end_time;                ///< End of last chunk (seconds)

    SignalMetadata()
        : signal_id(0), total_samples(0), chunk_count(0)
        , start_time(0.0), end_time(0.0) {}

    explicit SignalMetadata(const std::string& n)
        : signal_id(0), name(n), total_samples(0), chunk_count(0)
        , start_time(0.0), end_time(0.0) {}

    /// Get duration in seconds
    double duration() const { return end_time - start_time; }
};

/**
 * @brief One message of a signal stream
 *
 * Data messages carry end_flag=false; the single terminal message of a
 * successful stream carries end_flag=true.
 */
struct StreamMessage {
    double timestamp;
    double value;
    std::string desc;   ///< Reserved, always empty
    uint64_t seq;
    bool end_flag;

    StreamMessage() : timestamp(0.0), value(0.0), seq(0), end_flag(false) {}
    StreamMessage(double t, double v, uint64_t s, bool end)
        : timestamp(t), value(v), seq(s), end_flag(end) {}
};

// ============================================================================
// Boundary Types
// ============================================================================

/**
 * @brief Reply to an open-file request
 */
struct OpenFileResult {
    std::string reader_id;              ///< Catalog id of the opened reader
    std::string name;                   ///< Display name (file name)
    std::string path;                   ///< Path as requested
    std::string source;                 ///< Human-readable source label
    std::vector<std::string> headers;   ///< Public (disambiguated) signal names
    std::vector<std::string> tags;
    double created;                     ///< Creation time from the file header

    OpenFileResult() : created(0.0) {}
};

/**
 * @brief Signals registered for one opened reader
 */
struct ReaderSummary {
    std::string reader_id;
    std::string path;
    size_t signals_count;
    std::vector<std::string> headers;   ///< Sorted unique internal names

    ReaderSummary() : signals_count(0) {}
};

// ============================================================================
// Callback Types
// ============================================================================

/// Message callback: receives one stream message
using MessageCallback = std::function<void(const StreamMessage&)>;

/// Error callback: receives error message
using ErrorCallback = std::function<void(const std::string&)>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    /// Largest stored or raw chunk size accepted by default (256 MB)
    constexpr uint32_t DEFAULT_MAX_CHUNK_BYTES = 256u * 1024u * 1024u;

    /// Access mode accepted by open-file requests
    constexpr const char* OFFLINE_MODE = "offline";
}

} // namespace pltx
