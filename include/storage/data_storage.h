#pragma once

#include "response_record.h"

#include <filesystem>
#include <string>
#include <vector>

namespace storage {

// Source and sink of response records
class DataStorage {
public:
    virtual ~DataStorage() = default;

    // All stored records in insertion order
    virtual std::vector<ResponseRecord> loadRecords() const = 0;

    // Append one record; false if it could not be persisted
    virtual bool saveRecord(ResponseRecord const& record) = 0;

    virtual bool clear() = 0;
};

// Records kept as one JSON array in <directory>/<filename>.
// Unreadable or malformed files load as empty, with an error on stderr.
class JsonDataStorage : public DataStorage {
public:
    explicit JsonDataStorage(std::filesystem::path directory,
                             std::string const& filename = "test_results.json");

    std::vector<ResponseRecord> loadRecords() const override;

    // Stamps a local ISO-8601 timestamp when the record has none
    bool saveRecord(ResponseRecord const& record) override;

    bool clear() override;

    std::filesystem::path const& directory() const { return directory_; }
    std::filesystem::path const& dataFile() const { return data_file_; }

private:
    bool writeArray(nlohmann::json const& records) const;

    std::filesystem::path directory_;
    std::filesystem::path data_file_;
};

// Vector-backed store for tests and embedding
class MemoryDataStorage : public DataStorage {
public:
    MemoryDataStorage() = default;
    explicit MemoryDataStorage(std::vector<ResponseRecord> records) : records_(std::move(records)) {}

    std::vector<ResponseRecord> loadRecords() const override { return records_; }

    bool saveRecord(ResponseRecord const& record) override {
        records_.push_back(record);
        return true;
    }

    bool clear() override {
        records_.clear();
        return true;
    }

private:
    std::vector<ResponseRecord> records_;
};

// Current local time as "YYYY-MM-DDTHH:MM:SS"
std::string currentTimestamp();

} // namespace storage
