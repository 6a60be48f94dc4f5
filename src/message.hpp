#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pubsub {

// Chosen by the client, supplied on every subscribe/unsubscribe.
using subscriber_id = uint64_t;

// One published record as delivered to subscribers. Payload is opaque.
struct message {
    std::string topic;
    std::vector<char> payload;

    bool operator==(const message&) const = default;
};

// Identifies one registry entry.
struct subscription_key {
    std::string topic;
    subscriber_id subscriber = 0;

    bool operator==(const subscription_key&) const = default;
};

struct subscribe_request {
    std::string topic;
    subscriber_id subscriber = 0;
    // Where the broker streams message frames for this subscription
    std::string deliver_subject;
};

struct subscribe_response {
    bool success = false;
    std::string error;
};

struct unsubscribe_request {
    std::string topic;
    subscriber_id subscriber = 0;
};

struct unsubscribe_response {
    bool success = false;
};

struct publish_request {
    std::string topic;
    std::vector<char> payload;
};

struct publish_response {
    bool success = false;
};

} // namespace pubsub
