#pragma once
/**
 * @file table_store.h
 * @brief Durable key -> table storage boundary
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace eps_monitor {

/**
 * @brief Header plus string cells, as persisted
 */
struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    bool empty() const { return rows.empty(); }
};

/**
 * @brief Storage unreachable, unreadable or not writable
 *
 * Fatal for a run: continuing would overwrite accumulated data.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Abstract table store
 *
 * Writes replace the whole table; a failed save leaves the previous
 * table authoritative. Concurrent writers are not supported.
 */
class TableStore {
public:
    virtual ~TableStore() = default;

    /**
     * @return Table, or nullopt if the key does not exist
     * @throws StorageError if the table exists but cannot be read
     */
    virtual std::optional<CsvTable> load(const std::string& key) = 0;

    /**
     * @throws StorageError if the table cannot be written
     */
    virtual void save(const std::string& key, const CsvTable& table) = 0;
};

} // namespace eps_monitor
