#pragma once

#include "message.hpp"
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace pubsub {

// Thrown when a wire record cannot be decoded (bad MessagePack,
// missing field, wrong field type).
class codec_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// All records travel as MessagePack maps with named fields.

std::vector<char> encode(const subscribe_request& req);
std::vector<char> encode(const subscribe_response& resp);
std::vector<char> encode(const unsubscribe_request& req);
std::vector<char> encode(const unsubscribe_response& resp);
std::vector<char> encode(const publish_request& req);
std::vector<char> encode(const publish_response& resp);

// Message frame on a deliver subject.
std::vector<char> encode(const message& msg);

// Final frame on a deliver subject: the broker closed the subscription.
std::vector<char> encode_end_of_stream(const std::string& topic);

subscribe_request decode_subscribe_request(std::span<const char> bytes);
subscribe_response decode_subscribe_response(std::span<const char> bytes);
unsubscribe_request decode_unsubscribe_request(std::span<const char> bytes);
unsubscribe_response decode_unsubscribe_response(std::span<const char> bytes);
publish_request decode_publish_request(std::span<const char> bytes);
publish_response decode_publish_response(std::span<const char> bytes);

// Returns nullopt for an end-of-stream frame.
std::optional<message> decode_frame(std::span<const char> bytes);

} // namespace pubsub
