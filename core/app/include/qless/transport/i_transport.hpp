#pragma once

#include <stdexcept>
#include <string>

namespace qless {

// -----------------------------------------------------------------------------
// NotificationDeliveryFailure
// -----------------------------------------------------------------------------
// Thrown by an ITransport that cannot accept a message (buffer full, socket
// gone). Never escapes the QueueBroadcaster: the order mutation that caused
// the broadcast has already succeeded.
// -----------------------------------------------------------------------------
class NotificationDeliveryFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// ITransport — realtime publish/subscribe channel
// -----------------------------------------------------------------------------
//
// @brief  Routes one message to every subscriber of one channel.
//
// @details
// Channel keys are "global", "kitchen" and "order:{id}" (see
// channel_keys.hpp). Delivery is best-effort: no acknowledgement, no replay.
// Implementations must not block the caller on slow subscribers; they
// buffer locally (bounded) and throw NotificationDeliveryFailure when they
// cannot take the message.
//
// Thread model: publish() is called from the notification thread only, but
// implementations should tolerate any thread.
// -----------------------------------------------------------------------------
class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual void publish(const std::string& channel,
                       const std::string& message) = 0;
};

}  // namespace qless
