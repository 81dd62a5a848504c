#include "lanshare/client/connection_health.hpp"

namespace lanshare::client {

void ConnectionHealthRegistry::record_success(const Endpoint& endpoint, size_t file_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = records_[endpoint.key()];
    record.last_seen = std::chrono::system_clock::now();
    record.last_known_file_count = file_count;
    record.responsive = true;
}

void ConnectionHealthRegistry::record_failure(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(endpoint.key());
    if (it != records_.end()) {
        it->second.responsive = false;
    }
}

ConnectionHealth ConnectionHealthRegistry::get(const Endpoint& endpoint) const {
    ConnectionHealth health;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(endpoint.key());
    if (it == records_.end()) {
        return health;
    }
    health.responsive = it->second.responsive;
    health.last_known_file_count = it->second.last_known_file_count;
    health.age = std::chrono::system_clock::now() - it->second.last_seen;
    return health;
}

std::optional<ConnectionHealthRecord> ConnectionHealthRegistry::record(const Endpoint& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(endpoint.key());
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ConnectionHealthRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

size_t ConnectionHealthRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace lanshare::client
