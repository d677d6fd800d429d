#include "storage/data_storage.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;
using namespace storage;

namespace {

// Fresh directory under the system temp dir, removed on scope exit
struct TempDir {
    fs::path path;

    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("prompt_stability_test_" + std::to_string(rd()));
        fs::remove_all(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

ResponseRecord record(std::string prompt, std::string agent, std::string response) {
    ResponseRecord r;
    r.base_prompt = std::move(prompt);
    r.agent_name = std::move(agent);
    r.response = std::move(response);
    return r;
}

void writeFile(fs::path const& path, std::string const& contents) {
    std::ofstream out(path);
    out << contents;
}

} // namespace

void test_creates_directory_and_file() {
    std::cout << "Testing storage creates directory and empty array..." << std::endl;

    TempDir tmp;
    JsonDataStorage store(tmp.path / "nested");
    assert(fs::is_directory(tmp.path / "nested"));
    assert(fs::exists(store.dataFile()));
    assert(store.dataFile().filename() == "test_results.json");
    assert(store.loadRecords().empty());

    std::cout << "  PASS" << std::endl;
}

void test_save_and_load() {
    std::cout << "Testing save and load..." << std::endl;

    TempDir tmp;
    JsonDataStorage store(tmp.path);

    auto first = record("P1", "agentA", "hello");
    first.style_combination = "formal+short";
    first.sentiment = nlohmann::json{{"score", 0.5}, {"label", "neutral"}};
    assert(store.saveRecord(first));
    assert(store.saveRecord(record("P1", "agentB", "hi")));

    auto loaded = store.loadRecords();
    assert(loaded.size() == 2);
    assert(loaded[0].base_prompt == "P1");
    assert(loaded[0].agent_name == "agentA");
    assert(loaded[0].response == "hello");
    assert(loaded[0].style_combination == "formal+short");
    assert(loaded[0].sentiment.has_value());
    assert((*loaded[0].sentiment)["label"] == "neutral");
    assert(loaded[1].agent_name == "agentB");
    assert(!loaded[1].style_combination.has_value());

    // Save stamps YYYY-MM-DDTHH:MM:SS
    assert(loaded[0].timestamp.has_value());
    assert(loaded[0].timestamp->size() == 19);
    assert((*loaded[0].timestamp)[10] == 'T');

    // An existing timestamp is kept
    auto stamped = record("P2", "agentA", "x");
    stamped.timestamp = "2024-01-02T03:04:05";
    store.saveRecord(stamped);
    assert(store.loadRecords().back().timestamp == "2024-01-02T03:04:05");

    // A second store over the same file sees the same records
    JsonDataStorage reopened(tmp.path);
    assert(reopened.loadRecords().size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_corrupt_file() {
    std::cout << "Testing corrupt and non-array files load as empty..." << std::endl;

    TempDir tmp;
    JsonDataStorage store(tmp.path);

    writeFile(store.dataFile(), "{ not json");
    assert(store.loadRecords().empty());

    writeFile(store.dataFile(), "{\"base_prompt\": \"P\"}");
    assert(store.loadRecords().empty());

    // Saving over a corrupt file starts a fresh array
    writeFile(store.dataFile(), "[[[");
    assert(store.saveRecord(record("P", "A", "r")));
    assert(store.loadRecords().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_partial_entries() {
    std::cout << "Testing partial and foreign entries..." << std::endl;

    TempDir tmp;
    JsonDataStorage store(tmp.path);
    writeFile(store.dataFile(), R"([
        {"base_prompt": "P", "agent_name": "A", "response": "r", "extra": [1, 2]},
        {"base_prompt": "P", "response": "no agent"},
        {"base_prompt": "P", "agent_name": null, "response": "null agent"},
        42,
        "text"
    ])");

    auto loaded = store.loadRecords();
    assert(loaded.size() == 3);
    assert(loaded[0].isComplete());
    assert(!loaded[1].isComplete());
    assert(loaded[2].agent_name.empty());

    // Appending keeps fields the record type does not model
    store.saveRecord(record("P", "B", "r2"));
    std::ifstream in(store.dataFile());
    auto raw = nlohmann::json::parse(in);
    assert(raw.size() == 6);
    assert(raw[0]["extra"] == nlohmann::json::array({1, 2}));

    std::cout << "  PASS" << std::endl;
}

void test_clear() {
    std::cout << "Testing clear..." << std::endl;

    TempDir tmp;
    JsonDataStorage store(tmp.path, "custom.json");
    store.saveRecord(record("P", "A", "r"));
    assert(store.loadRecords().size() == 1);
    assert(store.clear());
    assert(store.loadRecords().empty());
    assert(fs::exists(tmp.path / "custom.json"));

    std::cout << "  PASS" << std::endl;
}

void test_memory_storage() {
    std::cout << "Testing MemoryDataStorage..." << std::endl;

    MemoryDataStorage store;
    assert(store.loadRecords().empty());
    store.saveRecord(record("P", "A", "r1"));
    store.saveRecord(record("P", "A", "r2"));
    assert(store.loadRecords().size() == 2);
    assert(store.loadRecords()[1].response == "r2");
    store.clear();
    assert(store.loadRecords().empty());

    std::cout << "  PASS" << std::endl;
}

void test_record_json() {
    std::cout << "Testing ResponseRecord JSON..." << std::endl;

    auto r = ResponseRecord::fromJSON({
        {"base_prompt", "P"},
        {"agent_name", "A"},
        {"response", 12},
        {"style_combination", nullptr},
        {"unknown", true},
    });
    assert(r.base_prompt == "P");
    assert(r.response.empty());
    assert(!r.style_combination.has_value());
    assert(!r.isComplete());

    auto j = record("P", "A", "r").toJSON();
    assert(j["base_prompt"] == "P");
    assert(j["style_combination"].is_null());
    assert(j["sentiment"].is_null());
    assert(!j.contains("timestamp"));
    assert(ResponseRecord::fromJSON(j) == record("P", "A", "r"));

    std::cout << "  PASS" << std::endl;
}

int main() {
    test_creates_directory_and_file();
    test_save_and_load();
    test_corrupt_file();
    test_partial_entries();
    test_clear();
    test_memory_storage();
    test_record_json();

    std::cout << "\nAll storage tests passed!" << std::endl;
    return 0;
}
