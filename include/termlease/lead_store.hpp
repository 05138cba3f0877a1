// include/termlease/lead_store.hpp
// Purpose: Append-only storage for captured leads
// In-memory store with optional JSON-lines persistence

#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <fstream>

#include <nlohmann/json.hpp>

namespace termlease {

//=============================================================================
// LEAD STORE - storage interface
//=============================================================================
class LeadStore {
public:
    virtual ~LeadStore() = default;

    // Never throws for persistence failures; those are logged
    virtual void append(const Lead& lead) = 0;
    virtual std::vector<Lead> all() const = 0;
    virtual size_t count() const = 0;
};

//=============================================================================
// MEMORY LEAD STORE - in-memory implementation with optional persistence
//=============================================================================
class MemoryLeadStore : public LeadStore {
public:
    // Loads existing lines from `persistence_file` if it is non-empty
    explicit MemoryLeadStore(const std::string& persistence_file = "");
    ~MemoryLeadStore() override;

    void append(const Lead& lead) override;
    std::vector<Lead> all() const override;
    size_t count() const override;

    bool persistence_enabled() const noexcept { return !persistence_file_.empty(); }
    const std::string& persistence_file() const noexcept { return persistence_file_; }
    uint64_t persistence_failures() const noexcept { return persistence_failures_.load(); }

    // Number of lines skipped while loading
    size_t skipped_lines() const noexcept { return skipped_lines_; }

private:
    mutable std::mutex mutex_;
    std::vector<Lead> leads_;
    std::string persistence_file_;
    std::ofstream writer_;
    size_t skipped_lines_ = 0;
    std::atomic<uint64_t> persistence_failures_{0};

    void load_from_disk();
    bool open_writer();
};

// JSON mapping shared by the store and the HTTP export
nlohmann::json lead_to_json(const Lead& lead);
Lead lead_from_json(const nlohmann::json& json);

} // namespace termlease
