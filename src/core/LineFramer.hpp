#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_host {

using json = nlohmann::json;

/**
 * @brief Splits a chunked text stream into complete lines
 *
 * Fragments may arrive with arbitrary boundaries. Complete lines are
 * returned in arrival order; the trailing partial line is kept until its
 * newline arrives. Lines are trimmed and empty lines are skipped.
 */
class LineFramer {
public:
    LineFramer() = default;

    /**
     * @brief Append a fragment and collect every line it completes
     * @param chunk Raw text as read from the stream
     * @return Complete, trimmed, non-empty lines
     */
    std::vector<std::string> feed(std::string_view chunk);

    /**
     * @brief Drop any buffered partial line
     */
    void clear();

    /**
     * @brief Text received after the last newline
     */
    const std::string& buffered() const { return buffer_; }

private:
    std::string buffer_;
};

/**
 * @brief ndjson framer: one JSON object per line
 *
 * Lines that fail to parse, or parse to something other than an object,
 * are logged and dropped so that one corrupt message never stops the stream.
 */
class NdjsonFramer {
public:
    /**
     * @param source_name Name used to tag log messages (usually the server name)
     */
    explicit NdjsonFramer(std::string source_name = "stream");

    /**
     * @brief Append a fragment and parse every line it completes
     * @return Decoded messages in arrival order
     */
    std::vector<json> feed(std::string_view chunk);

    void clear();

    const std::string& buffered() const { return lines_.buffered(); }

    /**
     * @brief Number of lines dropped because they were not valid JSON objects
     */
    size_t dropped() const { return dropped_; }

private:
    std::string source_name_;
    LineFramer lines_;
    size_t dropped_ = 0;
};

} // namespace mcp_host
