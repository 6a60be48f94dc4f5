#pragma once

#include "message.hpp"
#include <memory>

namespace pubsub {

// Outbound channel to one subscriber, supplied by the transport.
// Writes to one stream are serialized by the registry's delivery lock.
class subscriber_stream {
public:
    virtual ~subscriber_stream() = default;

    // Returns false if the peer is gone or the transport failed.
    // May also throw; the fan-out treats an exception as a failed write.
    virtual bool write(const message& msg) = 0;

    // Transport's view of connection liveness.
    virtual bool is_active() const = 0;
};

using subscriber_stream_sptr = std::shared_ptr<subscriber_stream>;

} // namespace pubsub
