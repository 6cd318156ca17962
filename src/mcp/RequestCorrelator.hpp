#pragma once

#include "mcp/JsonRpc.hpp"
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_host {

/**
 * @brief Tracks outstanding JSON-RPC requests and settles them
 *
 * Each pending request owns a promise and a deadline. Responses settle the
 * entry carrying their id; deadlines are enforced by calling expire()
 * periodically (the client read loop does this after every wake-up).
 * Every entry is settled exactly once: by a response, by expire(), by
 * reject(), or by reject_all() on teardown.
 *
 * Thread-safe.
 */
class RequestCorrelator {
public:
    using Clock = std::chrono::steady_clock;

    RequestCorrelator() = default;

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /**
     * @brief Register a new pending request
     * @param id Request id (must not already be pending)
     * @param method Method name, used in timeout messages
     * @param timeout Time allowed before the request is rejected
     * @return Future yielding the response result
     * @throws std::invalid_argument if id is already pending
     */
    std::future<json> add(RequestId id, const std::string& method, Clock::duration timeout);

    /**
     * @brief Settle the request matching a decoded response
     *
     * Resolves with result when there is no error field, otherwise rejects
     * with RpcError. Unknown, stale and duplicate ids are ignored.
     *
     * @return true if a pending request was settled
     */
    bool settle(const json& response);

    /**
     * @brief Reject one pending request with the given exception
     * @return true if the id was pending
     */
    bool reject(RequestId id, std::exception_ptr error);

    /**
     * @brief Reject every request whose deadline is at or before now
     * @return Number of requests that timed out
     */
    size_t expire(Clock::time_point now = Clock::now());

    /**
     * @brief Reject all pending requests with ConnectionClosedError
     * @return Number of requests rejected
     */
    size_t reject_all(const std::string& reason);

    /**
     * @brief Earliest deadline among pending requests, if any
     */
    std::optional<Clock::time_point> next_deadline() const;

    size_t size() const;
    bool contains(RequestId id) const;

private:
    struct PendingRequest {
        std::string method;
        std::promise<json> promise;
        Clock::time_point deadline;
    };

    mutable std::mutex mutex_;
    std::map<RequestId, PendingRequest> pending_;
};

} // namespace mcp_host
