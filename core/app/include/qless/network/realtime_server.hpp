#pragma once

#include "qless/concurrent/thread_safe_queue.hpp"
#include "qless/transport/i_transport.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace qless {

// -----------------------------------------------------------------------------
// RealtimeServer — ZeroMQ front door: channel fan-out plus command socket
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that publishes channel messages to
//         subscribers (PUB socket) and answers command requests (REP socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (tcp://127.0.0.1:5557 by default):
//      Every message goes out as two frames, [channel key, JSON payload].
//      A SUB client subscribes by channel key prefix ("global", "kitchen",
//      "order:42"). Messages reach the socket through a bounded
//      ThreadSafeQueue written by publish(); JSON building and ZMQ I/O
//      therefore never run on the caller's thread.
//
//   2. REP socket (tcp://127.0.0.1:5556 by default):
//      Each received request is passed to the CommandHandler callback
//      (bound to qless::CommandHandler::handle()) and its string reply is
//      sent back. ZMQ_RCVTIMEO keeps recv() from blocking, so the thread
//      alternates between command polling and outbound draining.
//
// Backpressure:
//   When subscribers are slow and the outbound buffer holds
//   publish_capacity messages, publish() refuses the next one, bumps
//   droppedCount() and throws NotificationDeliveryFailure. The caller
//   (QueueBroadcaster) logs and moves on; the next snapshot supersedes
//   what was lost.
//
// Thread model:
//   start() / stop() from the owning thread (main).
//   publish() from any thread (in practice the notification thread).
//   The CommandHandler runs on the server thread.
//
// Ownership:
//   Owned by main(). Owns the ZMQ context, both sockets, the outbound
//   buffer and the worker thread. OrderService's broadcaster holds it by
//   ITransport reference, so it must outlive the service.
// -----------------------------------------------------------------------------
class RealtimeServer final : public ITransport {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  static constexpr std::size_t kDefaultPublishCapacity = 4096;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  cmd_endpoint      ZMQ endpoint for the REP command socket.
  // @param  pub_endpoint      ZMQ endpoint for the PUB channel socket.
  // @param  publish_capacity  Outbound buffer bound (0 = unbounded).
  //
  // @details
  // No sockets are opened and no threads are spawned. Install the command
  // handler with setCommandHandler(), then call start().
  // -------------------------------------------------------------------------
  explicit RealtimeServer(std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                          std::string pub_endpoint = "tcp://127.0.0.1:5557",
                          std::size_t publish_capacity =
                              kDefaultPublishCapacity);

  // RAII: calls stop() if the thread is still running.
  ~RealtimeServer() override;

  RealtimeServer(const RealtimeServer&) = delete;
  RealtimeServer& operator=(const RealtimeServer&) = delete;
  RealtimeServer(RealtimeServer&&) = delete;
  RealtimeServer& operator=(RealtimeServer&&) = delete;

  // -------------------------------------------------------------------------
  // setCommandHandler(handler)
  // -------------------------------------------------------------------------
  // Must be called before start(). Without a handler every request is
  // answered with an error reply.
  // -------------------------------------------------------------------------
  void setCommandHandler(CommandHandler handler);

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Opens both sockets and spawns the server thread.
  //
  // @details
  // 1. Creates the ZMQ context.
  // 2. Binds the REP socket (commands) and the PUB socket (channels).
  // 3. Sets ZMQ_RCVTIMEO on the REP socket.
  // 4. Spawns the worker thread running run().
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker, joins it, then closes the sockets.
  //         Messages still buffered are flushed before the thread exits.
  //         Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // publish(channel, message)  [ITransport]
  // -------------------------------------------------------------------------
  // @brief  Buffers one message for the PUB socket.
  // @throws NotificationDeliveryFailure if the buffer is full.
  // -------------------------------------------------------------------------
  void publish(const std::string& channel, const std::string& message) override;

  bool isRunning() const { return running_.load(); }

  // Messages refused by publish() since construction.
  std::uint64_t droppedCount() const { return dropped_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  struct OutboundMessage {
    std::string channel;
    std::string payload;
  };

  // Worker loop: drain outbound, poll one command, repeat.
  void run();

  // Non-blocking: try_pop until empty, send each as [channel, payload].
  void processOutbound();

  // recv with timeout; dispatch to the handler and reply.
  void processCommands();

  std::string dispatch(const std::string& request);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<OutboundMessage> outbound_;
  std::atomic<std::uint64_t> dropped_{0};

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace qless
