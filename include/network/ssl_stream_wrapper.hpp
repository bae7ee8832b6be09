// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/raw_stream.hpp"
#include <boost/asio/ssl.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace ftpctl {
namespace network {

using SslStream = boost::asio::ssl::stream<RawStream>;

// Server certificate: PEM-encoded certificate chain (leaf first) and the
// matching private key.
struct ServerCertificate {
  std::string certificate_chain_pem;
  std::string private_key_pem;

  // Reads both files. Throws ConfigurationError if either is unreadable or
  // empty; the PEM contents are validated when an SSL context is built.
  static ServerCertificate load(const std::filesystem::path &certificate_file,
                                const std::filesystem::path &private_key_file);
};

using WrapHandler = std::function<void(const boost::system::error_code &ec,
                                       std::shared_ptr<SslStream> stream)>;
using CloseHandler = std::function<void(const boost::system::error_code &ec)>;

/**
 * Wraps a raw stream into a server-side TLS session and closes it again.
 *
 * Handlers run on the raw stream's executor.
 */
class SslStreamWrapperFactory {
public:
  virtual ~SslStreamWrapperFactory() = default;

  // Performs the server handshake. On failure the handler receives the
  // handshake error and a null stream. May throw ConfigurationError if the
  // certificate cannot be used.
  virtual void async_wrap_stream(RawStream raw_stream,
                                 const ServerCertificate &certificate,
                                 WrapHandler handler) = 0;

  // Graceful, best-effort shutdown (close_notify). The handler's error code
  // is informational only.
  virtual void async_close_stream(std::shared_ptr<SslStream> stream,
                                  CloseHandler handler) = 0;
};

/**
 * OpenSSL-backed factory (boost::asio::ssl). TLS 1.2 and newer only. One SSL
 * context is built per distinct certificate and reused for every wrap.
 */
class DefaultSslStreamWrapperFactory : public SslStreamWrapperFactory {
public:
  DefaultSslStreamWrapperFactory() = default;

  void async_wrap_stream(RawStream raw_stream,
                         const ServerCertificate &certificate,
                         WrapHandler handler) override;
  void async_close_stream(std::shared_ptr<SslStream> stream,
                          CloseHandler handler) override;

  // Builds (or returns the cached) context; throws ConfigurationError when the
  // certificate or key is rejected by OpenSSL.
  std::shared_ptr<boost::asio::ssl::context>
  context_for(const ServerCertificate &certificate);

private:
  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<boost::asio::ssl::context>> contexts_;
};

} // namespace network
} // namespace ftpctl
