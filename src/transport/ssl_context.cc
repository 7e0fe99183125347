#include "chatws/transport/ssl_context.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <algorithm>
#include <mutex>

#define CHATWS_LOG_COMPONENT "chatws.transport"
#include "chatws/logging/log_macros.h"

namespace chatws {
namespace transport {

namespace {

void initializeOpenSSL() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                         OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                     nullptr);
  });
}

int protocolToVersion(const std::string& protocol) {
  if (protocol == "TLSv1.2") return TLS1_2_VERSION;
  if (protocol == "TLSv1.3") return TLS1_3_VERSION;
  return 0;
}

}  // namespace

std::string getOpenSSLError() {
  std::string result;
  unsigned long code;
  while ((code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    if (!result.empty()) {
      result += "; ";
    }
    result += buf;
  }
  return result.empty() ? "unknown OpenSSL error" : result;
}

Result<SslContextSharedPtr> SslContext::create(const SslContextConfig& config) {
  initializeOpenSSL();

  SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
  if (!ctx) {
    return makeError<SslContextSharedPtr>(
        ErrorCode::kInternalError,
        "Failed to create SSL context: " + getOpenSSLError());
  }

  auto result = initialize(ctx, config);
  if (auto* error = getError(result)) {
    SSL_CTX_free(ctx);
    return *error;
  }

  return SslContextSharedPtr(new SslContext(ctx, config));
}

SslContext::SslContext(SSL_CTX* ctx, const SslContextConfig& config)
    : ctx_(ctx), config_(config) {}

SslContext::~SslContext() {
  if (ctx_) {
    SSL_CTX_free(ctx_);
    ctx_ = nullptr;
  }
}

Result<SSL*> SslContext::newSsl(const std::string& hostname) const {
  SSL* ssl = SSL_new(ctx_);
  if (!ssl) {
    return makeError<SSL*>(ErrorCode::kInternalError,
                           "Failed to create SSL: " + getOpenSSLError());
  }

  if (!hostname.empty()) {
    if (SSL_set_tlsext_host_name(ssl, hostname.c_str()) != 1) {
      SSL_free(ssl);
      return makeError<SSL*>(
          ErrorCode::kInternalError,
          "Failed to set SNI hostname: " + getOpenSSLError());
    }
    if (config_.verify_peer && SSL_set1_host(ssl, hostname.c_str()) != 1) {
      SSL_free(ssl);
      return makeError<SSL*>(
          ErrorCode::kInternalError,
          "Failed to set expected hostname: " + getOpenSSLError());
    }
  }

  ssl_connections_created_++;
  return ssl;
}

VoidResult SslContext::initialize(SSL_CTX* ctx, const SslContextConfig& config) {
  auto result = configureProtocols(ctx, config.protocols);
  if (getError(result)) {
    return result;
  }

  if (config.verify_peer) {
    int loaded = config.ca_cert_file.empty()
                     ? SSL_CTX_set_default_verify_paths(ctx)
                     : SSL_CTX_load_verify_locations(
                           ctx, config.ca_cert_file.c_str(), nullptr);
    if (loaded != 1) {
      return makeVoidError(Error(
          ErrorCode::kConfigError,
          "Failed to load CA certificates" +
              (config.ca_cert_file.empty() ? std::string()
                                           : " from " + config.ca_cert_file) +
              ": " + getOpenSSLError()));
    }
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, verifyCallback);
    SSL_CTX_set_verify_depth(ctx, 10);
  } else {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
  }

  result = configureAlpn(ctx, config.alpn_protocols);
  if (getError(result)) {
    return result;
  }

  SSL_CTX_set_mode(ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER |
                            SSL_MODE_ENABLE_PARTIAL_WRITE);
  return makeVoidSuccess();
}

VoidResult SslContext::configureProtocols(
    SSL_CTX* ctx, const std::vector<std::string>& protocols) {
  if (protocols.empty()) {
    return makeVoidSuccess();
  }

  int min_version = TLS1_3_VERSION;
  int max_version = 0;
  for (const auto& protocol : protocols) {
    int version = protocolToVersion(protocol);
    if (version == 0) {
      return makeVoidError(
          Error(ErrorCode::kConfigError, "Unknown TLS protocol: " + protocol));
    }
    min_version = std::min(min_version, version);
    max_version = std::max(max_version, version);
  }

  if (SSL_CTX_set_min_proto_version(ctx, min_version) != 1 ||
      SSL_CTX_set_max_proto_version(ctx, max_version) != 1) {
    return makeVoidError(
        Error(ErrorCode::kConfigError,
              "Failed to set protocol versions: " + getOpenSSLError()));
  }
  return makeVoidSuccess();
}

VoidResult SslContext::configureAlpn(
    SSL_CTX* ctx, const std::vector<std::string>& alpn_protocols) {
  if (alpn_protocols.empty()) {
    return makeVoidSuccess();
  }

  // Wire format: [length][protocol][length][protocol]...
  std::vector<unsigned char> alpn_list;
  for (const auto& protocol : alpn_protocols) {
    if (protocol.empty() || protocol.size() > 255) {
      return makeVoidError(Error(ErrorCode::kConfigError,
                                 "Invalid ALPN protocol: " + protocol));
    }
    alpn_list.push_back(static_cast<unsigned char>(protocol.size()));
    alpn_list.insert(alpn_list.end(), protocol.begin(), protocol.end());
  }

  // Returns 0 on success
  if (SSL_CTX_set_alpn_protos(ctx, alpn_list.data(),
                              static_cast<unsigned int>(alpn_list.size())) !=
      0) {
    return makeVoidError(Error(ErrorCode::kConfigError,
                               "Failed to set ALPN protocols: " +
                                   getOpenSSLError()));
  }
  return makeVoidSuccess();
}

int SslContext::verifyCallback(int preverify_ok, X509_STORE_CTX* ctx) {
  if (!preverify_ok) {
    int error = X509_STORE_CTX_get_error(ctx);
    CHATWS_LOG(Warning, "Certificate verification failed at depth {}: {}",
               X509_STORE_CTX_get_error_depth(ctx),
               X509_verify_cert_error_string(error));
  }
  return preverify_ok;
}

}  // namespace transport
}  // namespace chatws
