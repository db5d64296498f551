#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost {

/// Reassembles newline-delimited records from arbitrary-sized chunks.
/// Returned lines are trimmed of surrounding whitespace (including a CR
/// from CRLF endings); lines that trim to nothing are dropped.
class LineFramer {
public:
    static constexpr std::size_t DEFAULT_MAX_LINE = 16 * 1024 * 1024;

    explicit LineFramer(std::size_t max_line_bytes = DEFAULT_MAX_LINE);

    /// Append a chunk and return every line it completed, in order.
    /// Throws ParseError and discards the partial line if it grows past the limit.
    [[nodiscard]] std::vector<std::string> append(std::string_view chunk);

    /// Bytes held back waiting for a newline.
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

    /// Hand back the unterminated tail (trimmed) and clear it.
    [[nodiscard]] std::string take_remainder();

    static std::string_view trim(std::string_view line);

private:
    std::string buffer_;
    std::size_t max_line_bytes_;
};

} // namespace mcphost
