#include "mcphost/codec.hpp"
#include "mcphost/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace mcphost {

namespace {

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            simdjson::ondemand::number num = val.get_number();
            switch (num.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(num.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(num.get_uint64());
                default:
                    return nlohmann::json(num.get_double());
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

std::optional<RequestId> optional_id(const nlohmann::json& j) {
    if (!j.contains("id") || j.at("id").is_null()) return std::nullopt;
    RequestId id;
    from_json(j.at("id"), id);
    return id;
}

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::vector<std::string> model_names(const nlohmann::json& j) {
    std::vector<std::string> models;
    auto it = j.find("models");
    if (it == j.end() || !it->is_array()) return models;
    for (const auto& m : *it) {
        if (m.is_string()) {
            models.push_back(m.get<std::string>());
        } else if (m.is_object()) {
            auto name = string_field(m, "id");
            if (name.empty()) name = string_field(m, "name");
            if (!name.empty()) models.push_back(std::move(name));
        }
    }
    return models;
}

} // anonymous namespace

InboundMessage Codec::classify(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }

    std::string type = string_field(j, "type");

    if (type == "capability_response") {
        CapabilityResponseMessage cap;
        cap.id = optional_id(j);
        if (j.contains("result") && j.at("result").is_object()) {
            cap.result = j.at("result");
        }
        return cap;
    }

    if (type == "heartbeat") {
        HeartbeatMessage hb;
        hb.models = model_names(j);
        hb.raw = j;
        return hb;
    }

    auto id = optional_id(j);
    if (id && (j.contains("result") || j.contains("error"))) {
        ResponseMessage resp;
        resp.id = std::move(*id);
        if (j.contains("error") && !j.at("error").is_null()) {
            resp.error = j.at("error").get<RpcErrorInfo>();
        } else {
            resp.result = j.value("result", nlohmann::json(nullptr));
        }
        return resp;
    }

    std::string method = string_field(j, "method");
    if (method.empty()) method = type;
    if (id && !method.empty()) {
        RequestMessage req;
        req.id = std::move(*id);
        req.method = std::move(method);
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }

    return UnknownMessage{j};
}

InboundMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root;
        auto root_error = doc.get_value().get(root);
        if (root_error) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(root_error));
        }
        j = to_nlohmann(root);
        if (!doc.at_end()) {
            throw ParseError("Trailing content after JSON value");
        }
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }

    return classify(j);
}

std::string Codec::serialize(const RequestMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::string Codec::serialize(const ResponseMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::string Codec::serialize(const InboundMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcphost
