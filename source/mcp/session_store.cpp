#include "mcp/session_store.hpp"
#include "utils/text.hpp"

namespace mcp {

std::string SessionStore::get(const std::string &service_id) const {
    std::lock_guard<std::mutex> guard(map_mutex_);
    auto session_iterator = sessions_.find(service_id);
    if (session_iterator == sessions_.end()) {
        return "";
    }
    return session_iterator->second;
}

void SessionStore::set(const std::string &service_id, const std::string &session_id) {
    std::string trimmed_session = text::trim(session_id);
    if (trimmed_session.empty()) {
        return;
    }
    std::lock_guard<std::mutex> guard(map_mutex_);
    sessions_[service_id] = trimmed_session;
}

void SessionStore::clear(const std::string &service_id) {
    std::lock_guard<std::mutex> guard(map_mutex_);
    sessions_.erase(service_id);
}

std::string SessionStore::clear_if_matches(const std::string &service_id, const std::string &expected_session_id) {
    std::lock_guard<std::mutex> guard(map_mutex_);
    auto session_iterator = sessions_.find(service_id);
    if (session_iterator == sessions_.end()) {
        return "";
    }
    if (session_iterator->second != expected_session_id) {
        return session_iterator->second;
    }
    sessions_.erase(session_iterator);
    return "";
}

std::shared_ptr<std::mutex> SessionStore::service_lock(const std::string &service_id) {
    std::lock_guard<std::mutex> guard(map_mutex_);
    std::shared_ptr<std::mutex> &lock = service_locks_[service_id];
    if (!lock) {
        lock = std::make_shared<std::mutex>();
    }
    return lock;
}

} // namespace mcp
