#pragma once

/**
 * @file signal_catalog.hpp
 * @brief Process-wide registry of public signal names
 *
 * Maps the public (disambiguated) name of every exposed signal to the
 * reader that holds it and the signal's name inside that file.
 *
 * Naming policy:
 * - A signal keeps its name if no exposed signal uses it yet
 * - Otherwise it gets the first unused suffix: name_1, name_2, ...
 * - Names are assigned in registration order and never change
 * - Names stay reserved after their file is closed (no reuse)
 */

#include "pltx/core/types.hpp"
#include "pltx/data/pltx_reader.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pltx {

/**
 * @brief Resolved target of a public signal name
 */
struct CatalogEntry {
    std::string public_name;
    std::string reader_id;
    std::shared_ptr<PltxReader> reader;
    std::string internal_name;      ///< Name inside the file
    uint32_t signal_id;             ///< Id inside the file

    CatalogEntry() : signal_id(0) {}
};

/**
 * @brief Result of registering one reader
 */
struct Registration {
    std::string reader_id;
    std::vector<std::string> public_names;  ///< Index order
};

/**
 * @brief Thread-safe public-name registry
 *
 * Thread Safety:
 * - Lookups take a shared lock
 * - Registration and removal take an exclusive lock, so the names of one
 *   file are assigned atomically with respect to other registrations
 */
class SignalCatalog {
public:
    SignalCatalog() = default;
    ~SignalCatalog() = default;

    // Non-copyable, non-movable (due to mutex)
    SignalCatalog(const SignalCatalog&) = delete;
    SignalCatalog& operator=(const SignalCatalog&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Expose every signal of a reader
     * @param reader Opened reader (shared ownership is kept by the catalog)
     * @return Reader id and assigned public names in index order
     */
    Registration register_reader(const std::shared_ptr<PltxReader>& reader);

    /**
     * @brief Drop all entries of a reader
     *
     * The reader is released once no cursor holds it. Its public names
     * remain reserved.
     *
     * @return true if the reader was registered
     */
    bool unregister_reader(const std::string& reader_id);

    // ========================================================================
    // Lookup
    // ========================================================================

    /**
     * @brief Resolve a public name (exact match only)
     * @throws LookupError if the name is not exposed
     */
    CatalogEntry resolve(const std::string& public_name) const;

    /// Non-throwing variant of resolve()
    std::optional<CatalogEntry> find(const std::string& public_name) const;

    bool contains(const std::string& public_name) const;

    /// Public names currently exposed, in assignment order
    std::vector<std::string> public_names() const;

    size_t size() const;

    // ========================================================================
    // Readers
    // ========================================================================

    /// One summary per registered reader, in registration order
    std::vector<ReaderSummary> list_readers() const;

    /**
     * @brief Summary of one reader
     * @throws LookupError if the reader id is unknown
     */
    ReaderSummary reader_summary(const std::string& reader_id) const;

private:
    struct ReaderRecord {
        std::string reader_id;
        std::shared_ptr<PltxReader> reader;
        std::vector<std::string> public_names;
    };

    std::string assign_name(const std::string& base_name);
    ReaderSummary summarize(const ReaderRecord& record) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CatalogEntry> entries_;
    std::unordered_set<std::string> reserved_;
    std::vector<std::string> order_;
    std::vector<ReaderRecord> readers_;
    uint64_t next_reader_id_ = 1;
};

} // namespace pltx
