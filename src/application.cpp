#include "application.hpp"
#include "network/errors.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace ftpctl {
namespace app {

using json = nlohmann::json;
using network::ConfigurationError;

namespace {

// How long shutdown waits for relay cycles to unwind
constexpr auto SHUTDOWN_GRACE = std::chrono::seconds(5);

template <typename T>
T RequireType(const json &root, const char *key, bool (json::*is_type)() const noexcept,
              const char *type_name) {
  const json &value = root.at(key);
  if (!(value.*is_type)()) {
    throw ConfigurationError(std::string("config: '") + key + "' must be " + type_name);
  }
  return value.get<T>();
}

// Integer in [min, max]. Read as int64_t so that large unsigned values are
// range-checked instead of narrowed.
int64_t RequireInteger(const json &root, const char *key, int64_t min, int64_t max) {
  const json &value = root.at(key);
  if (!value.is_number_integer()) {
    throw ConfigurationError(std::string("config: '") + key + "' must be an integer");
  }
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw ConfigurationError(std::string("config: '") + key + "' must be between " +
                             std::to_string(min) + " and " + std::to_string(max));
  }
  int64_t parsed = value.get<int64_t>();
  if (parsed < min || parsed > max) {
    throw ConfigurationError(std::string("config: '") + key + "' must be between " +
                             std::to_string(min) + " and " + std::to_string(max));
  }
  return parsed;
}

size_t RequireSize(const json &root, const char *key) {
  const json &value = root.at(key);
  if (value.is_number_unsigned()) {
    return value.get<size_t>();
  }
  if (value.is_string()) {
    if (auto parsed = util::SafeParseSize(value.get<std::string>())) {
      return *parsed;
    }
  }
  throw ConfigurationError(std::string("config: '") + key +
                           "' must be a byte count (e.g. 65536 or \"64k\")");
}

} // namespace

void ApplyConfigJson(const json &root, AppConfig &config) {
  if (!root.is_object()) {
    throw ConfigurationError("config: top level must be an object");
  }

  try {
    if (root.contains("bind")) {
      config.bind_address = RequireType<std::string>(root, "bind", &json::is_string, "a string");
    }
    if (root.contains("port")) {
      config.port = static_cast<uint16_t>(RequireInteger(root, "port", 1, 65535));
    }
    if (root.contains("implicit_tls")) {
      config.implicit_tls =
          RequireType<bool>(root, "implicit_tls", &json::is_boolean, "a boolean");
    }
    if (root.contains("certificate")) {
      config.certificate_file =
          RequireType<std::string>(root, "certificate", &json::is_string, "a string");
    }
    if (root.contains("private_key")) {
      config.private_key_file =
          RequireType<std::string>(root, "private_key", &json::is_string, "a string");
    }
    if (root.contains("log_level")) {
      std::string level =
          RequireType<std::string>(root, "log_level", &json::is_string, "a string");
      if (!util::IsValidLogLevel(level)) {
        throw ConfigurationError("config: unknown log level '" + level + "'");
      }
      config.log_level = level;
    }
    if (root.contains("log_file")) {
      config.log_file = RequireType<std::string>(root, "log_file", &json::is_string, "a string");
    }
    if (root.contains("debug")) {
      const json &debug = root.at("debug");
      if (debug.is_string()) {
        config.debug_components = util::SplitList(debug.get<std::string>());
      } else if (debug.is_array()) {
        config.debug_components.clear();
        for (const auto &item : debug) {
          if (!item.is_string()) {
            throw ConfigurationError("config: 'debug' entries must be strings");
          }
          config.debug_components.push_back(item.get<std::string>());
        }
      } else {
        throw ConfigurationError("config: 'debug' must be a string or an array");
      }
    }
    if (root.contains("pause_writer_threshold")) {
      config.pipe_options.pause_writer_threshold = RequireSize(root, "pause_writer_threshold");
    }
    if (root.contains("resume_writer_threshold")) {
      config.pipe_options.resume_writer_threshold =
          RequireSize(root, "resume_writer_threshold");
    }
    if (root.contains("io_threads")) {
      config.io_threads = static_cast<size_t>(
          RequireInteger(root, "io_threads", 1, MAX_IO_THREADS));
    }
  } catch (const json::exception &e) {
    throw ConfigurationError(std::string("config: ") + e.what());
  }

  if (config.pipe_options.resume_writer_threshold >
      config.pipe_options.pause_writer_threshold) {
    throw ConfigurationError(
        "config: 'resume_writer_threshold' must not exceed 'pause_writer_threshold'");
  }
}

void LoadConfigFile(const std::filesystem::path &path, AppConfig &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigurationError("cannot open config file " + path.string());
  }

  json root;
  try {
    file >> root;
  } catch (const json::exception &e) {
    throw ConfigurationError("cannot parse config file " + path.string() + ": " + e.what());
  }
  ApplyConfigJson(root, config);
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("Initializing {}...", GetFullVersionString());

  ssl_factory_ = std::make_shared<network::DefaultSslStreamWrapperFactory>();

  if (!config_.certificate_file.empty() || !config_.private_key_file.empty()) {
    if (config_.certificate_file.empty() || config_.private_key_file.empty()) {
      LOG_APP_ERROR("--cert and --key must be given together");
      return false;
    }
    try {
      auto certificate = network::ServerCertificate::load(config_.certificate_file,
                                                          config_.private_key_file);
      // Build the context now so a bad certificate fails at startup
      ssl_factory_->context_for(certificate);
      certificate_ = std::move(certificate);
      LOG_APP_INFO("Loaded server certificate {}", config_.certificate_file.string());
    } catch (const ConfigurationError &e) {
      LOG_APP_ERROR("{}", e.what());
      return false;
    }
  }

  if (config_.implicit_tls && !certificate_) {
    LOG_APP_ERROR("implicit TLS requires a server certificate (--cert/--key)");
    return false;
  }

  listener_ = std::make_unique<network::SocketListener>(io_context_);
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_WARN("Application already running");
    return false;
  }
  if (!listener_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  if (!listener_->listen(config_.bind_address, config_.port,
                         [this](boost::asio::ip::tcp::socket socket) {
                           on_accept(std::move(socket));
                         })) {
    return false;
  }

  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));
  for (size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  setup_signal_handlers();
  running_ = true;

  LOG_APP_INFO("Relay listening on port {} ({})", listener_->listening_port(),
               config_.implicit_tls ? "implicit TLS" : "plain");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

uint16_t Application::listening_port() const {
  return listener_ ? listener_->listening_port() : 0;
}

size_t Application::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

void Application::on_accept(boost::asio::ip::tcp::socket socket) {
  auto executor = io_context_.get_executor();
  auto [socket_transport, socket_app] =
      network::DuplexPipe::create_pair(executor, config_.pipe_options);
  auto [connection_transport, connection_app] =
      network::DuplexPipe::create_pair(executor, config_.pipe_options);

  auto session = std::make_shared<Session>();
  session->connection =
      network::SocketPipeConnection::create(std::move(socket), socket_transport);
  session->service = network::TlsStreamService::create(
      executor, socket_app, connection_transport, ssl_factory_, certificate_,
      session->connection_closed);
  if (config_.implicit_tls) {
    session->service->set_encryption_enabled(true);
  }
  session->echo = network::PipeCopyLoop::create(
      connection_app.input_pipe(), connection_app.output_pipe(),
      util::CancellationToken::none(), "echo", []() {});

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    session->id = next_session_id_++;
    sessions_[session->id] = session;
  }

  // Socket gone -> the relay's connection is closed; an escalation from the
  // relay closes the socket.
  util::CancellationSource closed = session->connection_closed;
  session->socket_closed_registration = session->connection->closed_token().register_callback(
      [closed]() mutable { closed.cancel(); });
  std::weak_ptr<network::SocketPipeConnection> weak_connection = session->connection;
  session->escalation_registration =
      session->connection_closed.token().register_callback([weak_connection]() {
        if (auto connection = weak_connection.lock()) {
          connection->close();
        }
      });

  const uint64_t id = session->id;
  session->connection->set_disconnect_callback([this, id]() { end_session(id); });

  LOG_APP_INFO("Session {} opened from {}", id, session->connection->remote_address());
  session->service->start();
  session->echo->start();
  session->connection->start();
}

void Application::end_session(uint64_t id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      return;
    }
    session = it->second;
    sessions_.erase(it);
  }

  // The relay observes connection_closed on its own; stop() covers a paused
  // service. Do not wait here: this runs on an I/O thread.
  session->connection_closed.cancel();
  session->service->stop();
  LOG_APP_INFO("Session {} closed (status {})", id,
               network::ConnectionStatusAsString(session->service->status()));
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down relay...");

  if (listener_) {
    boost::asio::post(io_context_, [this]() { listener_->stop(); });
  }

  std::vector<std::shared_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto &[id, session] : sessions_) {
      sessions.push_back(session);
    }
    sessions_.clear();
  }

  std::vector<network::ServiceHandle> handles;
  for (auto &session : sessions) {
    handles.push_back(session->service->stop());
    session->connection->close();
  }
  for (auto &handle : handles) {
    if (handle.wait_for(SHUTDOWN_GRACE) != std::future_status::ready) {
      LOG_APP_WARN("Relay cycle did not stop within {}s",
                   std::chrono::duration_cast<std::chrono::seconds>(SHUTDOWN_GRACE).count());
    }
  }

  work_guard_.reset();
  io_context_.stop();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  if (listener_) {
    listener_->stop();
  }

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace ftpctl
