#include "riskgate/network/ipc_server.hpp"
#include "riskgate/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>
#include <utility>

namespace riskgate {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string command_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);
  cmd->set(zmq::sockopt::linger, 0);
  pub->set(zmq::sockopt::linger, 0);

  // A failed bind throws here, before any member is touched.
  cmd->bind(command_endpoint_);
  pub->bind(telemetry_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(cmd);
  pub_socket_ = std::move(pub);
  reported_drops_ = telemetry_queue_.dropped();
  reported_send_failures_ = send_failures_.load();

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. commands=" << command_endpoint_
            << " telemetry=" << telemetry_endpoint_ << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  // Sockets close before their context.
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] closed. telemetry dropped="
            << droppedTelemetry() << "\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// Worker loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    try {
      serveOneCommand();
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] command socket failed: " << e.what()
                << "; worker exiting\n";
      break;
    }
    publishTelemetry();
  }

  // Whatever was admitted before stop() still reaches subscribers.
  publishTelemetry();
}

void IpcServer::serveOneCommand() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};
  try {
    zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if ((items[0].revents & ZMQ_POLLIN) == 0) {
    return;
  }

  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  std::string reply;
  try {
    reply = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command handler threw: " << e.what() << "\n";
    reply = nlohmann::json{{"status", "error"}, {"message", e.what()}}.dump();
  }

  cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
}

void IpcServer::publishTelemetry() {
  for (const Event& event : telemetry_queue_.drain()) {
    const char* topic = telemetryTopic(event);
    const std::string body = toJson(event).dump();

    // PUB drops on a slow or absent subscriber rather than blocking.
    auto sent = pub_socket_->send(zmq::buffer(topic, std::strlen(topic)),
                                  zmq::send_flags::sndmore |
                                      zmq::send_flags::dontwait);
    if (!sent) {
      ++send_failures_;
      continue;
    }
    if (!pub_socket_->send(zmq::buffer(body), zmq::send_flags::dontwait)) {
      ++send_failures_;
    }
  }
  reportDrops();
}

std::uint64_t IpcServer::droppedTelemetry() const {
  return telemetry_queue_.dropped() + send_failures_.load();
}

void IpcServer::reportDrops() {
  const std::uint64_t evicted = telemetry_queue_.dropped();
  if (evicted != reported_drops_) {
    std::cerr << "[IpcServer] WARNING: telemetry queue full, "
              << (evicted - reported_drops_)
              << " oldest event(s) discarded\n";
    reported_drops_ = evicted;
  }

  const std::uint64_t failed = send_failures_.load();
  if (failed != reported_send_failures_) {
    std::cerr << "[IpcServer] WARNING: " << (failed - reported_send_failures_)
              << " telemetry event(s) could not be sent\n";
    reported_send_failures_ = failed;
  }
}

}  // namespace riskgate
