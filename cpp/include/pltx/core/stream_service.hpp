#pragma once

/**
 * @file stream_service.hpp
 * @brief Entry point used by the transport layer
 *
 * Ties together reader opening, the signal catalog and per-stream
 * sessions. One instance per process; the transport keeps it alive for
 * as long as requests are served.
 *
 * Usage:
 * @code
 *   StreamService service;
 *   OpenFileResult info = service.open_file("/data/run_42.pltx", "offline");
 *   CallbackSink sink([](const StreamMessage& m) { ... });
 *   StreamResult result = service.stream(info.headers[0], sink);
 * @endcode
 */

#include "pltx/core/signal_catalog.hpp"
#include "pltx/core/stream_sink.hpp"
#include "pltx/core/streaming_session.hpp"
#include "pltx/core/types.hpp"
#include "pltx/data/pltx_reader.hpp"
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace pltx {

/**
 * @brief Service configuration
 */
struct ServiceOptions {
    ReaderOptions reader;                               ///< Applied to every opened file
    std::string default_mode = constants::OFFLINE_MODE; ///< Mode used by open_file(path)
};

/**
 * @brief File opening and signal streaming
 *
 * Thread Safety:
 * - All methods may be called concurrently
 * - Each stream owns its cursor; readers are shared
 */
class StreamService {
public:
    explicit StreamService(const ServiceOptions& options = ServiceOptions());
    ~StreamService() = default;

    StreamService(const StreamService&) = delete;
    StreamService& operator=(const StreamService&) = delete;

    // ========================================================================
    // Files
    // ========================================================================

    /**
     * @brief Open a PLTX file and expose its signals
     * @param path File path
     * @param mode Access mode; only "offline" is supported
     * @throws std::invalid_argument for any other mode
     * @throws OpenError if the file cannot be opened
     */
    OpenFileResult open_file(const std::string& path, const std::string& mode);

    /// Open with the configured default mode
    OpenFileResult open_file(const std::string& path);

    /**
     * @brief Stop exposing the signals of a reader
     *
     * Streams already running keep the reader alive until they finish.
     * The public names stay reserved.
     */
    bool close_file(const std::string& reader_id);

    std::vector<ReaderSummary> list_readers() const;

    /// @throws LookupError if the reader id is unknown
    std::vector<std::string> reader_headers(const std::string& reader_id) const;

    // ========================================================================
    // Streaming
    // ========================================================================

    /**
     * @brief Stream one signal on the calling thread
     * @throws LookupError before any sink call if the name is unknown
     */
    StreamResult stream(const std::string& public_name, IStreamSink& sink);

    /**
     * @brief Stream one signal on its own worker
     *
     * The name is resolved before the worker starts.
     *
     * @throws LookupError if the name is unknown
     */
    std::future<StreamResult> stream_async(const std::string& public_name,
                                           std::shared_ptr<IStreamSink> sink);

    // ========================================================================
    // Accessors
    // ========================================================================

    SignalCatalog& catalog() { return catalog_; }
    const SignalCatalog& catalog() const { return catalog_; }
    const ServiceOptions& options() const { return options_; }

private:
    std::unique_ptr<SignalCursor> open_stream_cursor(const std::string& public_name) const;

    ServiceOptions options_;
    SignalCatalog catalog_;
};

} // namespace pltx
