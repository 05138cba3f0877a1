// src/lead_store.cpp
// Implementation of the lead store

#include "termlease/lead_store.hpp"
#include "termlease/logger.hpp"
#include "termlease/utils.hpp"
#include <cerrno>

namespace termlease {

namespace {
constexpr const char* LOG_COMPONENT = "leads";
}

nlohmann::json lead_to_json(const Lead& lead) {
    return nlohmann::json{
        {"email", lead.email},
        {"session_id", lead.session_id},
        {"captured_at", lead.captured_at},
        {"timestamp", Utils::timestamp_to_iso8601(lead.captured_at)},
        {"ip", lead.client_address}
    };
}

Lead lead_from_json(const nlohmann::json& json) {
    Lead lead;
    lead.email = json.at("email").get<std::string>();
    lead.session_id = json.value("session_id", std::string());
    lead.captured_at = json.value("captured_at", Timestamp{0});
    lead.client_address = json.value("ip", std::string());
    return lead;
}

MemoryLeadStore::MemoryLeadStore(const std::string& persistence_file)
    : persistence_file_(persistence_file) {
    if (persistence_enabled()) {
        load_from_disk();
        open_writer();
    }
}

MemoryLeadStore::~MemoryLeadStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writer_.is_open()) {
        writer_.flush();
        writer_.close();
    }
}

void MemoryLeadStore::append(const Lead& lead) {
    std::lock_guard<std::mutex> lock(mutex_);
    leads_.push_back(lead);

    if (!persistence_enabled()) {
        return;
    }

    if (!writer_.is_open() && !open_writer()) {
        persistence_failures_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    writer_ << lead_to_json(lead).dump() << '\n';
    writer_.flush();
    if (!writer_.good()) {
        persistence_failures_.fetch_add(1, std::memory_order_relaxed);
        TL_LOG_ERROR(LOG_COMPONENT, "Failed to persist lead to " << persistence_file_);
        writer_.close();
    }
}

std::vector<Lead> MemoryLeadStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leads_;
}

size_t MemoryLeadStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leads_.size();
}

void MemoryLeadStore::load_from_disk() {
    std::ifstream file(persistence_file_);
    if (!file.is_open()) {
        return;  // first run
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (Utils::trim(line).empty()) {
            continue;
        }
        try {
            leads_.push_back(lead_from_json(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            ++skipped_lines_;
            TL_LOG_WARN(LOG_COMPONENT, "Skipping malformed line " << line_number << " in "
                        << persistence_file_ << ": " << e.what());
        }
    }

    TL_LOG_INFO(LOG_COMPONENT, "Loaded " << leads_.size() << " leads from " << persistence_file_);
}

// Caller holds mutex_ or is the constructor
bool MemoryLeadStore::open_writer() {
    if (!Utils::create_directories(Utils::parent_directory(persistence_file_))) {
        TL_LOG_ERROR(LOG_COMPONENT, "Cannot create directory for " << persistence_file_);
        return false;
    }

    errno = 0;
    writer_.open(persistence_file_, std::ios::out | std::ios::app);
    if (!writer_.is_open()) {
        TL_LOG_ERROR(LOG_COMPONENT, Errors::io_error(persistence_file_, errno ? errno : EIO).what());
        return false;
    }
    return true;
}

} // namespace termlease
