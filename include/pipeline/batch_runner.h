#pragma once
/**
 * @file batch_runner.h
 * @brief Directory processing: extract every chart image and fold it into the stored tables
 */

#include "types.h"
#include "pipeline/chart_extractor.h"
#include "series/estimate_table.h"
#include "storage/table_store.h"

#include <string>
#include <vector>

namespace eps_monitor {

struct BatchOptions {
    size_t limit = 0;           ///< Max images to process (0 = all)
    bool reprocess = false;     ///< Also process dates already in the wide table
    bool progress = true;       ///< Print per-image progress lines to stdout
};

struct RunSummary {
    size_t processed = 0;
    size_t succeeded = 0;       ///< Images that produced records
    size_t noData = 0;          ///< Images with no OCR text or no matched pairs
    size_t failed = 0;          ///< Images that raised an error
    size_t newRecords = 0;
    size_t totalRows = 0;       ///< Wide table rows after the run
};

class BatchRunner {
public:
    /**
     * @param extractor Per-image pipeline, must outlive the runner
     * @param store Table storage, must outlive the runner
     */
    BatchRunner(ChartExtractor& extractor, TableStore& store,
                const PipelineConfig& config, const BatchOptions& options = BatchOptions{});

    /**
     * @brief Process all *.png images of a directory in name order
     *
     * Tables are saved after every image that produced records.
     *
     * @throws StorageError if the tables cannot be read or written
     * @throws std::runtime_error if the directory does not exist
     */
    RunSummary run(const std::string& imageDir);

    /**
     * @brief *.png files of a directory sorted by filename
     */
    static std::vector<std::string> collectImages(const std::string& imageDir);

    /**
     * @brief Drop images whose report date already has a row, then apply the limit
     */
    std::vector<std::string> selectImages(const std::vector<std::string>& images,
                                          const EstimateTable& existing) const;

    const EstimateTable& wideTable() const { return m_wide; }
    const ConfidenceTable& confidenceTable() const { return m_confidence; }

private:
    void loadTables();
    void saveTables();

    ChartExtractor& m_extractor;
    TableStore& m_store;
    StorageConfig m_storage;
    ConfidenceConfig m_confidenceConfig;
    BatchOptions m_options;
    QuarterParser m_parser;

    EstimateTable m_wide;
    ConfidenceTable m_confidence;
};

} // namespace eps_monitor
