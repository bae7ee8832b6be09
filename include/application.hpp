#pragma once

#include "network/pipe.hpp"
#include "network/pipe_copy.hpp"
#include "network/socket_transport.hpp"
#include "network/ssl_stream_wrapper.hpp"
#include "network/tls_stream_service.hpp"
#include "util/cancellation.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <csignal>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ftpctl {
namespace app {

// Upper bound for AppConfig::io_threads
constexpr int MAX_IO_THREADS = 64;

// Application configuration
struct AppConfig {
  // Listen address; empty binds all interfaces (dual-stack)
  std::string bind_address;
  uint16_t port = 2121;

  // TLS from the first byte of every connection (no plaintext phase)
  bool implicit_tls = false;
  std::filesystem::path certificate_file;
  std::filesystem::path private_key_file;

  // Logging
  std::string log_level = "info";
  std::filesystem::path log_file;  // empty: stdout
  std::vector<std::string> debug_components;

  // Buffering per pipe
  network::PipeOptions pipe_options;

  size_t io_threads = 1;
};

/**
 * Apply a JSON configuration document to config.
 *
 * Recognized keys: bind, port, implicit_tls, certificate, private_key,
 * log_level, log_file, debug, pause_writer_threshold,
 * resume_writer_threshold, io_threads. Unknown keys are ignored; missing keys
 * keep their current value. Throws network::ConfigurationError on a value of
 * the wrong type or out of range.
 */
void ApplyConfigJson(const nlohmann::json &root, AppConfig &config);

// Read and apply a JSON config file. Throws network::ConfigurationError if
// the file cannot be read or parsed.
void LoadConfigFile(const std::filesystem::path &path, AppConfig &config);

// Application - relay daemon coordinator
// Accepts TCP connections and runs one TlsStreamService per connection, with
// an echo loop on the application side of the connection pipe. Handles
// SIGINT/SIGTERM and coordinates shutdown.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Status
  bool is_running() const { return running_; }
  uint16_t listening_port() const;
  size_t session_count() const;

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  // One accepted control connection
  struct Session {
    uint64_t id = 0;
    std::shared_ptr<network::SocketPipeConnection> connection;
    std::shared_ptr<network::TlsStreamService> service;
    std::shared_ptr<network::PipeCopyLoop> echo;
    util::CancellationSource connection_closed;
    util::CancellationRegistration socket_closed_registration;
    util::CancellationRegistration escalation_registration;
  };

  void on_accept(boost::asio::ip::tcp::socket socket);
  void end_session(uint64_t id);
  void shutdown();

  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  std::unique_ptr<network::SocketListener> listener_;
  std::shared_ptr<network::DefaultSslStreamWrapperFactory> ssl_factory_;
  std::optional<network::ServerCertificate> certificate_;

  mutable std::mutex sessions_mutex_;
  std::map<uint64_t, std::shared_ptr<Session>> sessions_;
  uint64_t next_session_id_{1};

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace ftpctl
