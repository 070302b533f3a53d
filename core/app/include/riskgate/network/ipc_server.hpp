#pragma once

#include "riskgate/concurrent/thread_safe_queue.hpp"
#include "riskgate/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace riskgate {

// -----------------------------------------------------------------------------
// IpcServer — operator command port and admission telemetry feed
// -----------------------------------------------------------------------------
//
// @brief  One worker thread owning a REP socket for operator commands and a
//         PUB socket for order transitions and admission rejections.
//
// @details
//   Commands (command_endpoint, REP):
//     Every request gets exactly one reply, the string returned by the
//     command handler (AdmissionEngine::executeCommand()). A handler that
//     throws is answered with {"status":"error"} so the REP state machine
//     never stalls.
//
//   Telemetry (telemetry_endpoint, PUB):
//     Two frames per event: the topic (telemetryTopic(), e.g.
//     "admission_reject") then the JSON body. A subscriber that only wants
//     rejections subscribes to "admission_reject".
//
//   The worker waits on the REP socket with zmq::poll for at most
//   kPollTimeoutMs, then flushes telemetry, so events go out within one
//   poll interval even when no commands arrive.
//
//   The telemetry queue holds at most kTelemetryCapacity events. When the
//   worker falls behind, the oldest are discarded and the count is logged;
//   admission threads never block on publishing. An event whose topic or
//   body frame the PUB socket refuses is counted as dropped too.
//
// Thread model:
//   start() / stop() from the owning thread (AdmissionEngine).
//   pushTelemetry() from any thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  static constexpr std::size_t kTelemetryCapacity = 65536;

  IpcServer(CommandHandler command_handler,
            std::string command_endpoint,
            std::string telemetry_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both endpoints and spawns the worker. No-op while running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound; nothing is left
  //         running in that case.
  void start();

  // Flushes queued telemetry, joins the worker and closes the sockets.
  // Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // Events evicted from the queue plus events the socket refused.
  std::uint64_t droppedTelemetry() const;

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void serveOneCommand();
  void publishTelemetry();
  void reportDrops();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryCapacity};
  std::atomic<std::uint64_t> send_failures_{0};
  std::uint64_t reported_drops_{0};          // worker thread only
  std::uint64_t reported_send_failures_{0};  // worker thread only

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace riskgate
