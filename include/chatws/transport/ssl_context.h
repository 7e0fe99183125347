/**
 * @file ssl_context.h
 * @brief Client TLS context for wss:// connections
 */

#ifndef CHATWS_TRANSPORT_SSL_CONTEXT_H
#define CHATWS_TRANSPORT_SSL_CONTEXT_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "chatws/core/result.h"

// Forward declare OpenSSL types to avoid exposing OpenSSL headers
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;
typedef struct x509_store_ctx_st X509_STORE_CTX;

namespace chatws {
namespace transport {

class SslContext;
using SslContextSharedPtr = std::shared_ptr<SslContext>;

struct SslContextConfig {
  bool verify_peer{true};
  std::string ca_cert_file;  // System default paths when empty

  std::vector<std::string> protocols{"TLSv1.2", "TLSv1.3"};
  std::vector<std::string> alpn_protocols{"http/1.1"};
};

/**
 * OpenSSL client context wrapper.
 *
 * Immutable after creation and shared by every connection a transport
 * factory opens.
 */
class SslContext {
 public:
  static Result<SslContextSharedPtr> create(const SslContextConfig& config);

  ~SslContext();

  /**
   * Create a new SSL object for one connection.
   *
   * SNI is set to `hostname`; when peer verification is enabled the
   * certificate must also match it. Returns an Error when OpenSSL fails.
   * The caller owns the returned SSL*.
   */
  Result<SSL*> newSsl(const std::string& hostname) const;

  SSL_CTX* getNativeContext() const { return ctx_; }

  const SslContextConfig& getConfig() const { return config_; }

  uint64_t connectionsCreated() const { return ssl_connections_created_; }

 private:
  SslContext(SSL_CTX* ctx, const SslContextConfig& config);

  static VoidResult initialize(SSL_CTX* ctx, const SslContextConfig& config);
  static VoidResult configureProtocols(SSL_CTX* ctx,
                                       const std::vector<std::string>& protocols);
  static VoidResult configureAlpn(
      SSL_CTX* ctx, const std::vector<std::string>& alpn_protocols);
  static int verifyCallback(int preverify_ok, X509_STORE_CTX* ctx);

  SSL_CTX* ctx_;
  SslContextConfig config_;

  mutable std::atomic<uint64_t> ssl_connections_created_{0};

  SslContext(const SslContext&) = delete;
  SslContext& operator=(const SslContext&) = delete;
};

// Drains the OpenSSL error queue into a printable string
std::string getOpenSSLError();

}  // namespace transport
}  // namespace chatws

#endif  // CHATWS_TRANSPORT_SSL_CONTEXT_H
