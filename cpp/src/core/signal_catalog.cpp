/**
 * @file signal_catalog.cpp
 * @brief Implementation of the public signal name registry
 */

#include "pltx/core/signal_catalog.hpp"
#include "pltx/core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <sstream>

namespace pltx {

// ============================================================================
// Registration
// ============================================================================

Registration SignalCatalog::register_reader(const std::shared_ptr<PltxReader>& reader) {
    if (!reader) {
        throw std::invalid_argument("Cannot register a null reader");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::ostringstream id;
    id << std::hex << next_reader_id_++;

    ReaderRecord record;
    record.reader_id = id.str();
    record.reader = reader;

    for (const auto& entry : reader->index().signals()) {
        const SignalMetadata& meta = entry.metadata;
        std::string public_name = assign_name(meta.name);

        if (public_name != meta.name) {
            std::cout << "[Catalog] Register signal: " << public_name
                      << " (original: " << meta.name << ")" << std::endl;
        }

        CatalogEntry catalog_entry;
        catalog_entry.public_name = public_name;
        catalog_entry.reader_id = record.reader_id;
        catalog_entry.reader = reader;
        catalog_entry.internal_name = meta.name;
        catalog_entry.signal_id = meta.signal_id;

        entries_.emplace(public_name, std::move(catalog_entry));
        order_.push_back(public_name);
        record.public_names.push_back(public_name);
    }

    Registration result;
    result.reader_id = record.reader_id;
    result.public_names = record.public_names;

    readers_.push_back(std::move(record));
    return result;
}

bool SignalCatalog::unregister_reader(const std::string& reader_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = std::find_if(readers_.begin(), readers_.end(),
        [&](const ReaderRecord& r) { return r.reader_id == reader_id; });
    if (it == readers_.end()) {
        return false;
    }

    for (const auto& name : it->public_names) {
        entries_.erase(name);
    }
    order_.erase(std::remove_if(order_.begin(), order_.end(),
        [&](const std::string& name) { return entries_.find(name) == entries_.end(); }),
        order_.end());

    readers_.erase(it);
    return true;
}

// ============================================================================
// Lookup
// ============================================================================

CatalogEntry SignalCatalog::resolve(const std::string& public_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(public_name);
    if (it == entries_.end()) {
        throw LookupError(public_name);
    }
    return it->second;
}

std::optional<CatalogEntry> SignalCatalog::find(const std::string& public_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(public_name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SignalCatalog::contains(const std::string& public_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.find(public_name) != entries_.end();
}

std::vector<std::string> SignalCatalog::public_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return order_;
}

size_t SignalCatalog::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// Readers
// ============================================================================

std::vector<ReaderSummary> SignalCatalog::list_readers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ReaderSummary> result;
    result.reserve(readers_.size());
    for (const auto& record : readers_) {
        result.push_back(summarize(record));
    }
    return result;
}

ReaderSummary SignalCatalog::reader_summary(const std::string& reader_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& record : readers_) {
        if (record.reader_id == reader_id) {
            return summarize(record);
        }
    }
    throw LookupError("Unknown reader: " + reader_id, reader_id);
}

// ============================================================================
// Private Methods
// ============================================================================

std::string SignalCatalog::assign_name(const std::string& base_name) {
    // Caller holds the exclusive lock
    std::string candidate = base_name;
    for (uint64_t suffix = 1; reserved_.count(candidate); ++suffix) {
        candidate = base_name + "_" + std::to_string(suffix);
    }
    reserved_.insert(candidate);
    return candidate;
}

ReaderSummary SignalCatalog::summarize(const ReaderRecord& record) const {
    ReaderSummary summary;
    summary.reader_id = record.reader_id;
    summary.path = record.reader->path();
    summary.headers = record.reader->get_signal_names();
    std::sort(summary.headers.begin(), summary.headers.end());
    summary.headers.erase(std::unique(summary.headers.begin(), summary.headers.end()),
                          summary.headers.end());
    summary.signals_count = summary.headers.size();
    return summary;
}

} // namespace pltx
