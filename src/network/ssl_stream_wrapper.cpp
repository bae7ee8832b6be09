// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/ssl_stream_wrapper.hpp"
#include "network/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <boost/asio/bind_executor.hpp>

namespace ftpctl {
namespace network {

namespace ssl = boost::asio::ssl;

ServerCertificate
ServerCertificate::load(const std::filesystem::path &certificate_file,
                        const std::filesystem::path &private_key_file) {
  ServerCertificate certificate;
  certificate.certificate_chain_pem = util::read_file_string(certificate_file);
  if (certificate.certificate_chain_pem.empty()) {
    throw ConfigurationError("cannot read certificate file " +
                             certificate_file.string());
  }
  certificate.private_key_pem = util::read_file_string(private_key_file);
  if (certificate.private_key_pem.empty()) {
    throw ConfigurationError("cannot read private key file " +
                             private_key_file.string());
  }
  return certificate;
}

std::shared_ptr<ssl::context>
DefaultSslStreamWrapperFactory::context_for(const ServerCertificate &certificate) {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string key = certificate.certificate_chain_pem + certificate.private_key_pem;
  auto it = contexts_.find(key);
  if (it != contexts_.end()) {
    return it->second;
  }

  auto context = std::make_shared<ssl::context>(ssl::context::tls_server);
  try {
    context->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                         ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
    context->use_certificate_chain(
        boost::asio::buffer(certificate.certificate_chain_pem));
    context->use_private_key(boost::asio::buffer(certificate.private_key_pem),
                             ssl::context::pem);
  } catch (const boost::system::system_error &e) {
    throw ConfigurationError(std::string("unusable server certificate: ") + e.what());
  }

  contexts_.emplace(key, context);
  LOG_TLS_DEBUG("created TLS server context ({} cached)", contexts_.size());
  return context;
}

void DefaultSslStreamWrapperFactory::async_wrap_stream(
    RawStream raw_stream, const ServerCertificate &certificate,
    WrapHandler handler) {
  auto context = context_for(certificate);
  auto stream = std::make_shared<SslStream>(std::move(raw_stream), *context);

  LOG_TLS_TRACE("starting server handshake");
  // The context must outlive the stream's SSL object; the cache keeps it, but
  // the capture makes that independent of cache eviction.
  stream->async_handshake(
      ssl::stream_base::server,
      boost::asio::bind_executor(
          stream->get_executor(),
          [stream, context, handler = std::move(handler)](
              const boost::system::error_code &ec) {
            if (ec) {
              LOG_TLS_DEBUG("server handshake failed: {}", ec.message());
              handler(ec, nullptr);
              return;
            }
            LOG_TLS_TRACE("server handshake complete");
            handler(ec, stream);
          }));
}

void DefaultSslStreamWrapperFactory::async_close_stream(
    std::shared_ptr<SslStream> stream, CloseHandler handler) {
  if (!stream) {
    handler(boost::system::error_code());
    return;
  }
  stream->async_shutdown(boost::asio::bind_executor(
      stream->get_executor(),
      [stream, handler = std::move(handler)](const boost::system::error_code &ec) {
        // eof / stream_truncated are the normal outcome when the peer does
        // not answer close_notify before the transport read is cancelled
        LOG_TLS_TRACE("shutdown finished: {}", ec ? ec.message() : "ok");
        handler(ec);
      }));
}

} // namespace network
} // namespace ftpctl
