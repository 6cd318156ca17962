#include "RequestCorrelator.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace mcp_host {

std::future<json> RequestCorrelator::add(RequestId id, const std::string& method,
                                         Clock::duration timeout) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pending_.count(id) != 0) {
        throw std::invalid_argument("Request id already pending: " + std::to_string(id));
    }

    PendingRequest entry;
    entry.method = method;
    entry.deadline = Clock::now() + timeout;
    auto future = entry.promise.get_future();
    pending_.emplace(id, std::move(entry));
    return future;
}

bool RequestCorrelator::settle(const json& response) {
    RequestId id = 0;
    if (!jsonrpc::response_id(response, id)) {
        spdlog::debug("Ignoring response without integer id: {}", response.dump());
        return false;
    }

    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            spdlog::debug("Ignoring response for unknown or completed request {}", id);
            return false;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    if (jsonrpc::is_error_response(response)) {
        entry.promise.set_exception(std::make_exception_ptr(jsonrpc::error_from_response(response)));
    } else {
        entry.promise.set_value(response.value("result", json()));
    }
    return true;
}

bool RequestCorrelator::reject(RequestId id, std::exception_ptr error) {
    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    entry.promise.set_exception(error);
    return true;
}

size_t RequestCorrelator::expire(Clock::time_point now) {
    std::vector<PendingRequest> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                spdlog::warn("Request {} ({}) timed out", it->first, it->second.method);
                expired.push_back(std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& entry : expired) {
        entry.promise.set_exception(
            std::make_exception_ptr(TimeoutError("Request timeout: " + entry.method)));
    }
    return expired.size();
}

size_t RequestCorrelator::reject_all(const std::string& reason) {
    std::map<RequestId, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }

    for (auto& [id, entry] : drained) {
        spdlog::debug("Rejecting pending request {} ({}): {}", id, entry.method, reason);
        entry.promise.set_exception(std::make_exception_ptr(ConnectionClosedError(reason)));
    }
    return drained.size();
}

std::optional<RequestCorrelator::Clock::time_point> RequestCorrelator::next_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Clock::time_point> earliest;
    for (const auto& [id, entry] : pending_) {
        if (!earliest || entry.deadline < *earliest) {
            earliest = entry.deadline;
        }
    }
    return earliest;
}

size_t RequestCorrelator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RequestCorrelator::contains(RequestId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) != 0;
}

} // namespace mcp_host
