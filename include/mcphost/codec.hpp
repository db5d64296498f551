#pragma once
#include "message.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcphost {

class Codec {
public:
    /// Parse one line of tool server output into a message.
    /// Throws ParseError on invalid JSON, non-object values or malformed ids.
    [[nodiscard]] static InboundMessage parse(std::string_view raw);

    /// Sort an already-parsed object into one of the inbound shapes.
    [[nodiscard]] static InboundMessage classify(const nlohmann::json& j);

    [[nodiscard]] static std::string serialize(const RequestMessage& msg);
    [[nodiscard]] static std::string serialize(const ResponseMessage& msg);
    [[nodiscard]] static std::string serialize(const InboundMessage& msg);
};

} // namespace mcphost
