#include "mcphost/line_framer.hpp"
#include "mcphost/error.hpp"

namespace mcphost {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // anonymous namespace

LineFramer::LineFramer(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes) {
    buffer_.reserve(4096);
}

std::string_view LineFramer::trim(std::string_view line) {
    while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
    while (!line.empty() && is_space(line.back())) line.remove_suffix(1);
    return line;
}

std::vector<std::string> LineFramer::append(std::string_view chunk) {
    std::vector<std::string> lines;
    buffer_.append(chunk.data(), chunk.size());

    size_t pos = 0;
    while (true) {
        size_t nl = buffer_.find('\n', pos);
        if (nl == std::string::npos) break;

        auto line = trim(std::string_view(buffer_).substr(pos, nl - pos));
        pos = nl + 1;
        if (!line.empty()) lines.emplace_back(line);
    }

    if (pos > 0) {
        buffer_.erase(0, pos);
    }

    if (buffer_.size() > max_line_bytes_) {
        auto size = buffer_.size();
        buffer_.clear();
        throw ParseError("Line exceeds " + std::to_string(max_line_bytes_) +
                         " bytes without a newline (" + std::to_string(size) + " buffered)");
    }
    return lines;
}

std::string LineFramer::take_remainder() {
    std::string rest(trim(buffer_));
    buffer_.clear();
    return rest;
}

} // namespace mcphost
