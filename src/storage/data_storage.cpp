#include "storage/data_storage.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace storage {

namespace {

// Raw record array; empty on any read or parse failure
json readArray(std::filesystem::path const& path) {
    std::ifstream in(path);
    if (!in) {
        return json::array();
    }

    try {
        json j = json::parse(in);
        if (!j.is_array()) {
            std::cerr << "Warning: " << path << " does not hold a JSON array, ignoring contents\n";
            return json::array();
        }
        return j;
    } catch (json::exception const& e) {
        std::cerr << "Error parsing " << path << ": " << e.what() << "\n";
    }
    return json::array();
}

} // namespace

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

JsonDataStorage::JsonDataStorage(std::filesystem::path directory, std::string const& filename)
    : directory_(std::move(directory)), data_file_(directory_ / filename) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        std::cerr << "Warning: Could not create storage directory " << directory_ << ": "
                  << ec.message() << "\n";
        return;
    }
    if (!std::filesystem::exists(data_file_)) {
        writeArray(json::array());
    }
}

std::vector<ResponseRecord> JsonDataStorage::loadRecords() const {
    std::vector<ResponseRecord> records;
    if (!std::filesystem::exists(data_file_)) {
        return records;
    }

    json array = readArray(data_file_);
    records.reserve(array.size());

    size_t skipped = 0;
    for (auto const& entry : array) {
        if (!entry.is_object()) {
            skipped++;
            continue;
        }
        records.push_back(ResponseRecord::fromJSON(entry));
    }
    if (skipped > 0) {
        std::cerr << "Warning: Skipped " << skipped << " non-object entries in " << data_file_ << "\n";
    }
    return records;
}

bool JsonDataStorage::saveRecord(ResponseRecord const& record) {
    ResponseRecord stamped = record;
    if (!stamped.timestamp) {
        stamped.timestamp = currentTimestamp();
    }

    // Append to the raw array so fields this tool does not model survive
    json array = readArray(data_file_);
    array.push_back(stamped.toJSON());
    return writeArray(array);
}

bool JsonDataStorage::clear() {
    return writeArray(json::array());
}

bool JsonDataStorage::writeArray(json const& records) const {
    std::ofstream out(data_file_);
    if (!out) {
        std::cerr << "Error: Could not open " << data_file_ << " for writing\n";
        return false;
    }
    out << records.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return static_cast<bool>(out);
}

} // namespace storage
