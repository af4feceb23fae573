/**
 * @file stream_service.cpp
 * @brief Implementation of the transport-facing service
 */

#include "pltx/core/stream_service.hpp"
#include "pltx/data/signal_cursor.hpp"
#include <stdexcept>
#include <utility>

namespace pltx {

StreamService::StreamService(const ServiceOptions& options)
    : options_(options) {}

// ============================================================================
// Files
// ============================================================================

OpenFileResult StreamService::open_file(const std::string& path, const std::string& mode) {
    if (mode != constants::OFFLINE_MODE) {
        throw std::invalid_argument("Unsupported access mode: '" + mode + "'");
    }

    std::shared_ptr<PltxReader> reader = PltxReader::open(path, options_.reader);
    Registration registration = catalog_.register_reader(reader);

    OpenFileResult result;
    result.reader_id = registration.reader_id;
    result.name = reader->display_name();
    result.path = path;
    result.source = "PLTX File Read - " + reader->display_name();
    result.headers = std::move(registration.public_names);
    result.tags = {"table", "pltx"};
    result.created = reader->header().created;
    return result;
}

OpenFileResult StreamService::open_file(const std::string& path) {
    return open_file(path, options_.default_mode);
}

bool StreamService::close_file(const std::string& reader_id) {
    return catalog_.unregister_reader(reader_id);
}

std::vector<ReaderSummary> StreamService::list_readers() const {
    return catalog_.list_readers();
}

std::vector<std::string> StreamService::reader_headers(const std::string& reader_id) const {
    return catalog_.reader_summary(reader_id).headers;
}

// ============================================================================
// Streaming
// ============================================================================

StreamResult StreamService::stream(const std::string& public_name, IStreamSink& sink) {
    StreamingSession session(public_name, open_stream_cursor(public_name), sink);
    return session.run();
}

std::future<StreamResult> StreamService::stream_async(const std::string& public_name,
                                                      std::shared_ptr<IStreamSink> sink) {
    if (!sink) {
        throw std::invalid_argument("Stream sink must not be null");
    }

    std::unique_ptr<SignalCursor> cursor = open_stream_cursor(public_name);

    return std::async(std::launch::async,
        [public_name, cursor = std::move(cursor), sink = std::move(sink)]() mutable {
            StreamingSession session(public_name, std::move(cursor), *sink);
            return session.run();
        });
}

// ============================================================================
// Private Methods
// ============================================================================

std::unique_ptr<SignalCursor> StreamService::open_stream_cursor(const std::string& public_name) const {
    CatalogEntry entry = catalog_.resolve(public_name);
    return entry.reader->open_cursor(entry.signal_id);
}

} // namespace pltx
