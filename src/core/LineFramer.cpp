#include "LineFramer.hpp"
#include <spdlog/spdlog.h>

namespace mcp_host {

namespace {

std::string_view trim(std::string_view text) {
    const char* whitespace = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::vector<std::string> LineFramer::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    buffer_.append(chunk.data(), chunk.size());

    size_t start = 0;
    size_t newline = buffer_.find('\n', start);
    while (newline != std::string::npos) {
        auto line = trim(std::string_view(buffer_).substr(start, newline - start));
        if (!line.empty()) {
            lines.emplace_back(line);
        }
        start = newline + 1;
        newline = buffer_.find('\n', start);
    }

    // Keep incomplete last line for the next chunk
    buffer_.erase(0, start);
    return lines;
}

void LineFramer::clear() {
    buffer_.clear();
}

NdjsonFramer::NdjsonFramer(std::string source_name)
    : source_name_(std::move(source_name)) {
}

std::vector<json> NdjsonFramer::feed(std::string_view chunk) {
    std::vector<json> messages;

    for (const auto& line : lines_.feed(chunk)) {
        try {
            json message = json::parse(line);
            if (!message.is_object()) {
                spdlog::warn("[{}] Ignoring non-object message: {}", source_name_, line);
                ++dropped_;
                continue;
            }
            messages.push_back(std::move(message));
        } catch (const json::parse_error& e) {
            spdlog::warn("[{}] Failed to parse message: {} ({})", source_name_, line, e.what());
            ++dropped_;
        }
    }

    return messages;
}

void NdjsonFramer::clear() {
    lines_.clear();
}

} // namespace mcp_host
