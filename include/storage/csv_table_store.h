#pragma once
/**
 * @file csv_table_store.h
 * @brief TableStore backed by CSV files under a root directory
 */

#include "storage/table_store.h"

#include <string>

namespace eps_monitor {

class CsvTableStore : public TableStore {
public:
    /**
     * @param rootDir Directory holding one CSV per key (created on first save)
     */
    explicit CsvTableStore(std::string rootDir);

    std::optional<CsvTable> load(const std::string& key) override;

    /**
     * @brief Write to a temp file in the same directory, then rename over the target
     */
    void save(const std::string& key, const CsvTable& table) override;

    std::string pathFor(const std::string& key) const;
    const std::string& rootDir() const { return m_rootDir; }

    /**
     * @brief Split CSV text into a table (RFC 4180 quoting, CRLF tolerated)
     * @throws StorageError on an unterminated quoted field
     */
    static CsvTable parse(const std::string& text);

    /**
     * @brief Serialize a table, quoting fields that need it
     */
    static std::string serialize(const CsvTable& table);

private:
    std::string m_rootDir;
};

} // namespace eps_monitor
