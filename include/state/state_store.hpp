#pragma once

/**
 * StateStore - JSON persistence of the agent across restarts
 *
 * File layout:
 *   {
 *     "version": 1,
 *     "running": true,
 *     "consecutive_errors": 0,
 *     "history": [ {trade}, ... ],
 *     "performance": {win_rate, total_trades, ...}
 *   }
 *
 * save() writes to "<path>.tmp" then renames over the target, so a crash
 * mid-write leaves the previous file intact. load() treats a missing file
 * as a first start and a corrupt file as empty (logged).
 */

#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chartagent {
namespace state {

using json = nlohmann::json;

struct PersistedState {
    bool running = false;
    int32_t consecutive_errors = 0;
    std::vector<TradeRecord> history;
    PerformanceSnapshot performance; // Informational; recomputed on load
};

enum class LoadStatus : uint8_t { Loaded = 0, Missing, Corrupt };

inline const char* load_status_to_string(LoadStatus status) {
    switch (status) {
        case LoadStatus::Loaded: return "loaded";
        case LoadStatus::Missing: return "missing";
        case LoadStatus::Corrupt: return "corrupt";
        default: return "unknown";
    }
}

struct LoadResult {
    LoadStatus status = LoadStatus::Missing;
    PersistedState state;
    std::string error;
};

// JSON codecs, exposed for tests and history export
json trade_to_json(const TradeRecord& trade);
TradeRecord trade_from_json(const json& j);
json performance_to_json(const PerformanceSnapshot& perf);
PerformanceSnapshot performance_from_json(const json& j);

class StateStore {
public:
    explicit StateStore(std::string path, logging::AsyncLogger* logger = nullptr)
        : path_(std::move(path)), logger_(logger) {}

    bool save(const PersistedState& state) const;
    LoadResult load() const;

    /**
     * Write trades to "<directory>/trade_history_YYYYmmdd_HHMMSS.json".
     * @return path written, empty on failure
     */
    std::string export_history(const std::vector<TradeRecord>& trades, const std::string& directory = ".") const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    logging::AsyncLogger* logger_;
};

} // namespace state
} // namespace chartagent
