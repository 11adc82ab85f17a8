#pragma once

#include "qless/transport/i_transport.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace qless {
namespace testing {

// -----------------------------------------------------------------------------
// RecordingTransport
// -----------------------------------------------------------------------------
// ITransport test double. Captures every (channel, message) pair in publish
// order. failOn(channel) makes every publish to that channel throw
// NotificationDeliveryFailure; failAll() makes every publish throw.
// -----------------------------------------------------------------------------
class RecordingTransport final : public ITransport {
 public:
  struct Sent {
    std::string channel;
    nlohmann::json message;
  };

  void publish(const std::string& channel,
               const std::string& message) override {
    std::lock_guard lock(mutex_);
    if (fail_all_ || channel == fail_channel_) {
      ++failed_;
      throw NotificationDeliveryFailure("refused publish to " + channel);
    }
    sent_.push_back(Sent{channel, nlohmann::json::parse(message)});
  }

  void failOn(std::string channel) {
    std::lock_guard lock(mutex_);
    fail_channel_ = std::move(channel);
  }

  void failAll(bool fail = true) {
    std::lock_guard lock(mutex_);
    fail_all_ = fail;
  }

  std::vector<Sent> sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  // Messages on one channel, in publish order.
  std::vector<nlohmann::json> on(const std::string& channel) const {
    std::lock_guard lock(mutex_);
    std::vector<nlohmann::json> out;
    for (const auto& s : sent_) {
      if (s.channel == channel) out.push_back(s.message);
    }
    return out;
  }

  int failed() const {
    std::lock_guard lock(mutex_);
    return failed_;
  }

  void clear() {
    std::lock_guard lock(mutex_);
    sent_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Sent> sent_;
  std::string fail_channel_;
  bool fail_all_{false};
  int failed_{0};
};

}  // namespace testing
}  // namespace qless
