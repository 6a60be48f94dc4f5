#include "codec.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace pubsub {

namespace {

using json = nlohmann::json;

std::vector<char> to_bytes(const json& j) {
    auto packed = json::to_msgpack(j);
    return std::vector<char>(packed.begin(), packed.end());
}

json binary_field(const std::vector<char>& payload) {
    return json::binary(std::vector<std::uint8_t>(payload.begin(), payload.end()));
}

std::vector<char> read_binary(const json& j, const char* field) {
    const auto& value = j.at(field);
    if (!value.is_binary()) {
        throw codec_error(std::string("field '") + field + "' is not binary");
    }
    const auto& bin = value.get_binary();
    return std::vector<char>(bin.begin(), bin.end());
}

// MessagePack senders may pack a non-negative id as a signed integer.
subscriber_id read_subscriber_id(const json& j) {
    const auto& value = j.at("subscriber_id");
    if (value.is_number_unsigned()) {
        return value.get<subscriber_id>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<subscriber_id>(value.get<std::int64_t>());
    }
    throw codec_error("field 'subscriber_id' is not a non-negative integer");
}

// Parses a MessagePack map and hands it to `read`, translating every
// nlohmann exception into codec_error.
template <typename Read>
auto parse(std::span<const char> bytes, const char* what, Read&& read) {
    try {
        auto j = json::from_msgpack(bytes.begin(), bytes.end());
        if (!j.is_object()) {
            throw codec_error(std::string(what) + ": not a map");
        }
        return read(j);
    } catch (const json::exception& e) {
        throw codec_error(std::string(what) + ": " + e.what());
    }
}

} // namespace

std::vector<char> encode(const subscribe_request& req) {
    return to_bytes({
        {"topic", req.topic},
        {"subscriber_id", req.subscriber},
        {"deliver_subject", req.deliver_subject}
    });
}

std::vector<char> encode(const subscribe_response& resp) {
    json j = {{"success", resp.success}};
    if (!resp.error.empty()) j["error"] = resp.error;
    return to_bytes(j);
}

std::vector<char> encode(const unsubscribe_request& req) {
    return to_bytes({{"topic", req.topic}, {"subscriber_id", req.subscriber}});
}

std::vector<char> encode(const unsubscribe_response& resp) {
    return to_bytes({{"success", resp.success}});
}

std::vector<char> encode(const publish_request& req) {
    return to_bytes({{"topic", req.topic}, {"payload", binary_field(req.payload)}});
}

std::vector<char> encode(const publish_response& resp) {
    return to_bytes({{"success", resp.success}});
}

std::vector<char> encode(const message& msg) {
    return to_bytes({{"topic", msg.topic}, {"payload", binary_field(msg.payload)}});
}

std::vector<char> encode_end_of_stream(const std::string& topic) {
    return to_bytes({{"topic", topic}, {"end", true}});
}

subscribe_request decode_subscribe_request(std::span<const char> bytes) {
    return parse(bytes, "subscribe_request", [](const json& j) {
        subscribe_request req;
        req.topic = j.at("topic").get<std::string>();
        req.subscriber = read_subscriber_id(j);
        req.deliver_subject = j.at("deliver_subject").get<std::string>();
        if (req.deliver_subject.empty()) {
            throw codec_error("subscribe_request: empty deliver_subject");
        }
        return req;
    });
}

subscribe_response decode_subscribe_response(std::span<const char> bytes) {
    return parse(bytes, "subscribe_response", [](const json& j) {
        subscribe_response resp;
        resp.success = j.at("success").get<bool>();
        if (auto it = j.find("error"); it != j.end()) {
            resp.error = it->get<std::string>();
        }
        return resp;
    });
}

unsubscribe_request decode_unsubscribe_request(std::span<const char> bytes) {
    return parse(bytes, "unsubscribe_request", [](const json& j) {
        unsubscribe_request req;
        req.topic = j.at("topic").get<std::string>();
        req.subscriber = read_subscriber_id(j);
        return req;
    });
}

unsubscribe_response decode_unsubscribe_response(std::span<const char> bytes) {
    return parse(bytes, "unsubscribe_response", [](const json& j) {
        return unsubscribe_response{j.at("success").get<bool>()};
    });
}

publish_request decode_publish_request(std::span<const char> bytes) {
    return parse(bytes, "publish_request", [](const json& j) {
        publish_request req;
        req.topic = j.at("topic").get<std::string>();
        req.payload = read_binary(j, "payload");
        return req;
    });
}

publish_response decode_publish_response(std::span<const char> bytes) {
    return parse(bytes, "publish_response", [](const json& j) {
        return publish_response{j.at("success").get<bool>()};
    });
}

std::optional<message> decode_frame(std::span<const char> bytes) {
    return parse(bytes, "message", [](const json& j) -> std::optional<message> {
        if (auto it = j.find("end"); it != j.end() && it->get<bool>()) {
            return std::nullopt;
        }
        message msg;
        msg.topic = j.at("topic").get<std::string>();
        msg.payload = read_binary(j, "payload");
        return msg;
    });
}

} // namespace pubsub
