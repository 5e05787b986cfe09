/**
 * @file csv_table_store.cpp
 * @brief CSV file persistence for wide and confidence tables
 */

#include "storage/csv_table_store.h"
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace eps_monitor {

namespace {

bool needsQuoting(const std::string& field) {
    return field.find_first_of(",\"\r\n") != std::string::npos;
}

void appendField(std::string& out, const std::string& field) {
    if (!needsQuoting(field)) {
        out += field;
        return;
    }
    out += '"';
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
}

void appendLine(std::string& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ',';
        appendField(out, fields[i]);
    }
    out += '\n';
}

} // namespace

CsvTableStore::CsvTableStore(std::string rootDir)
    : m_rootDir(std::move(rootDir)) {}

std::string CsvTableStore::pathFor(const std::string& key) const {
    return (fs::path(m_rootDir) / key).string();
}

CsvTable CsvTableStore::parse(const std::string& text) {
    std::vector<std::vector<std::string>> lines;
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;
    bool lineHasContent = false;

    auto endLine = [&]() {
        if (lineHasContent || !field.empty() || !fields.empty()) {
            fields.push_back(std::move(field));
            lines.push_back(std::move(fields));
        }
        fields.clear();
        field.clear();
        lineHasContent = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                inQuotes = true;
                lineHasContent = true;
                break;
            case ',':
                fields.push_back(std::move(field));
                field.clear();
                lineHasContent = true;
                break;
            case '\r':
                break;
            case '\n':
                endLine();
                break;
            default:
                field += c;
                lineHasContent = true;
                break;
        }
    }
    if (inQuotes) {
        throw StorageError("Unterminated quoted field in CSV");
    }
    endLine();

    CsvTable table;
    if (lines.empty()) return table;

    table.header = std::move(lines.front());
    table.rows.assign(std::make_move_iterator(lines.begin() + 1),
                      std::make_move_iterator(lines.end()));
    return table;
}

std::string CsvTableStore::serialize(const CsvTable& table) {
    std::string out;
    appendLine(out, table.header);
    for (const auto& row : table.rows) {
        appendLine(out, row);
    }
    return out;
}

std::optional<CsvTable> CsvTableStore::load(const std::string& key) {
    const fs::path path = pathFor(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw StorageError("Cannot access " + path.string() + ": " + ec.message());
        }
        logDebug("No existing table at " + path.string());
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError("Cannot open table for reading: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw StorageError("Error reading table: " + path.string());
    }

    try {
        CsvTable table = parse(buffer.str());
        logDebug("Loaded " + std::to_string(table.rows.size()) + " rows from " + path.string());
        return table;
    } catch (const StorageError& e) {
        throw StorageError(path.string() + ": " + e.what());
    }
}

void CsvTableStore::save(const std::string& key, const CsvTable& table) {
    const fs::path path = pathFor(key);

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StorageError("Cannot create directory " + path.parent_path().string() +
                               ": " + ec.message());
        }
    }

    const fs::path tmpPath = path.string() + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("Cannot open table for writing: " + tmpPath.string());
        }
        file << serialize(table);
        file.flush();
        if (!file.good()) {
            file.close();
            fs::remove(tmpPath, ec);
            throw StorageError("Error writing table: " + tmpPath.string());
        }
    }

    fs::rename(tmpPath, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw StorageError("Cannot replace " + path.string() + ": " + reason);
    }

    logDebug("Saved " + std::to_string(table.rows.size()) + " rows to " + path.string());
}

} // namespace eps_monitor
