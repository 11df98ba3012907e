// include/market_ingest/ingest/json_file_source.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "market_ingest/ingest/source_adapter.hpp"

namespace market_ingest {

/**
 * @brief Source reading normalized records dropped as JSON files
 *
 * Records for a date live in <root>/<dataset>/<YYYY-MM-DD>.json as an array
 * of objects whose fields carry the entity member names. Dates are
 * "YYYY-MM-DD" strings and revenue months are YYYYMM integers.
 */
class JsonFileSource {
public:
    JsonFileSource(std::filesystem::path root, std::string dataset, RecordKind kind);

    /**
     * @brief Records of the target date, filtered to target.code when set
     *
     * An item with unreadable fields is still returned, its natural key left
     * invalid so that merging rejects it without losing the rest of the file.
     * @return FETCH_ERROR while the file has not been published,
     * PARSE_ERROR when the file is not a readable JSON array
     */
    Result<std::vector<NormalizedRecord>> fetch(const FetchTarget& target) const;

    std::filesystem::path file_for(const Date& date) const;

    RecordKind kind() const {
        return kind_;
    }

    const std::string& dataset() const {
        return dataset_;
    }

    /**
     * @brief Parse one JSON object as a record of the given kind
     * @throws nlohmann::json::exception or std::invalid_argument on bad fields
     */
    static NormalizedRecord parse_record(const nlohmann::json& j, RecordKind kind);

private:
    std::filesystem::path root_;
    std::string dataset_;
    RecordKind kind_;
};

/**
 * @brief Wrap a JsonFileSource as a SourceAdapter named after its dataset
 */
SourceAdapter make_json_file_adapter(const std::filesystem::path& root,
                                     const std::string& dataset, RecordKind kind);

}  // namespace market_ingest
