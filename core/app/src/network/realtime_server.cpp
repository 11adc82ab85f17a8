#include "qless/network/realtime_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace qless {

RealtimeServer::RealtimeServer(std::string cmd_endpoint,
                               std::string pub_endpoint,
                               std::size_t publish_capacity)
    : cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      outbound_(publish_capacity) {}

RealtimeServer::~RealtimeServer() { stop(); }

void RealtimeServer::setCommandHandler(CommandHandler handler) {
  command_handler_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void RealtimeServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[RealtimeServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_
            << " capacity=" << outbound_.capacity() << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void RealtimeServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[RealtimeServer] stopped. dropped=" << dropped_.load()
            << "\n";
}

// -----------------------------------------------------------------------------
// publish(): bounded, never blocks on subscribers
// -----------------------------------------------------------------------------
void RealtimeServer::publish(const std::string& channel,
                             const std::string& message) {
  if (!outbound_.try_push(OutboundMessage{channel, message})) {
    dropped_.fetch_add(1);
    throw NotificationDeliveryFailure("outbound buffer full (" +
                                      std::to_string(outbound_.capacity()) +
                                      "), dropped message for " + channel);
  }
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void RealtimeServer::run() {
  while (running_.load()) {
    processOutbound();
    processCommands();
  }

  // Final drain: flush whatever the notification thread queued last.
  processOutbound();
}

// -----------------------------------------------------------------------------
// processOutbound(): two-frame message per channel publish
// -----------------------------------------------------------------------------
void RealtimeServer::processOutbound() {
  while (auto maybe_msg = outbound_.try_pop()) {
    zmq::message_t key(maybe_msg->channel.data(), maybe_msg->channel.size());
    zmq::message_t body(maybe_msg->payload.data(), maybe_msg->payload.size());
    try {
      pub_socket_->send(key, zmq::send_flags::sndmore | zmq::send_flags::dontwait);
      pub_socket_->send(body, zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
      std::cerr << "[RealtimeServer] WARNING: send on " << maybe_msg->channel
                << " failed: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void RealtimeServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = dispatch(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// dispatch(): a REP socket must answer every request, even on failure
// -----------------------------------------------------------------------------
std::string RealtimeServer::dispatch(const std::string& request) {
  nlohmann::json error;
  error["status"] = "error";
  error["error"] = "InternalError";

  if (!command_handler_) {
    error["message"] = "no command handler installed";
    return error.dump();
  }
  try {
    return command_handler_(request);
  } catch (const std::exception& e) {
    std::cerr << "[RealtimeServer] ERROR: command handler threw: " << e.what()
              << "\n";
    error["message"] = e.what();
    return error.dump();
  }
}

}  // namespace qless
