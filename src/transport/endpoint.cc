#include "chatws/transport/endpoint.h"

#include <algorithm>
#include <cctype>

namespace chatws {
namespace transport {

namespace {

struct UrlParts {
  std::string scheme;  // Lower-cased
  std::string authority;  // Without userinfo
  std::string path_and_query;  // Without fragment
};

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

VoidResult splitUrl(const std::string& url, UrlParts& parts) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return makeVoidError(
        Error(ErrorCode::kInvalidArgument, "Missing URL scheme: " + url));
  }
  parts.scheme = toLower(url.substr(0, scheme_end));

  std::string rest = url.substr(scheme_end + 3);
  auto authority_end = rest.find_first_of("/?#");
  parts.authority = rest.substr(0, authority_end);
  std::string tail =
      authority_end == std::string::npos ? "" : rest.substr(authority_end);
  parts.path_and_query = tail.substr(0, tail.find('#'));

  auto at = parts.authority.rfind('@');
  if (at != std::string::npos) {
    parts.authority = parts.authority.substr(at + 1);
  }
  if (parts.authority.empty()) {
    return makeVoidError(
        Error(ErrorCode::kInvalidArgument, "Missing URL host: " + url));
  }
  return makeVoidSuccess();
}

VoidResult splitHostPort(const std::string& authority,
                         std::string& host,
                         std::string& port) {
  std::string remainder;
  if (authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return makeVoidError(Error(ErrorCode::kInvalidArgument,
                                 "Unterminated IPv6 address: " + authority));
    }
    host = authority.substr(1, close - 1);
    remainder = authority.substr(close + 1);
  } else {
    auto colon = authority.find(':');
    host = authority.substr(0, colon);
    remainder = colon == std::string::npos ? "" : authority.substr(colon);
  }

  if (!remainder.empty()) {
    if (remainder[0] != ':' || remainder.size() == 1) {
      return makeVoidError(
          Error(ErrorCode::kInvalidArgument, "Malformed authority: " + authority));
    }
    port = remainder.substr(1);
  }
  if (host.empty()) {
    return makeVoidError(
        Error(ErrorCode::kInvalidArgument, "Missing URL host: " + authority));
  }
  return makeVoidSuccess();
}

}  // namespace

std::string WebSocketUrl::hostHeader() const {
  std::string result =
      host.find(':') != std::string::npos ? "[" + host + "]" : host;
  uint16_t default_port = secure ? 443 : 80;
  if (port != 0 && port != default_port) {
    result += ":" + std::to_string(port);
  }
  return result;
}

std::string WebSocketUrl::toString() const {
  return std::string(secure ? "wss://" : "ws://") + hostHeader() + path;
}

Result<WebSocketUrl> parseWebSocketUrl(const std::string& url) {
  UrlParts parts;
  auto split = splitUrl(url, parts);
  if (auto* error = getError(split)) {
    return *error;
  }

  WebSocketUrl result;
  if (parts.scheme == "wss") {
    result.secure = true;
  } else if (parts.scheme != "ws") {
    return makeError<WebSocketUrl>(ErrorCode::kInvalidArgument,
                                   "Unsupported WebSocket scheme: " +
                                       parts.scheme);
  }

  std::string port;
  auto host_port = splitHostPort(parts.authority, result.host, port);
  if (auto* error = getError(host_port)) {
    return *error;
  }

  if (port.empty()) {
    result.port = result.secure ? 443 : 80;
  } else {
    if (port.size() > 5 ||
        !std::all_of(port.begin(), port.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return makeError<WebSocketUrl>(ErrorCode::kInvalidArgument,
                                     "Invalid port: " + port);
    }
    unsigned long value = std::stoul(port);
    if (value == 0 || value > 65535) {
      return makeError<WebSocketUrl>(ErrorCode::kInvalidArgument,
                                     "Invalid port: " + port);
    }
    result.port = static_cast<uint16_t>(value);
  }

  if (parts.path_and_query.empty()) {
    result.path = "/";
  } else if (parts.path_and_query[0] == '?') {
    result.path = "/" + parts.path_and_query;
  } else {
    result.path = parts.path_and_query;
  }
  return result;
}

Result<std::string> resolveStreamingEndpoint(const std::string& base_url,
                                             const std::string& path) {
  UrlParts parts;
  auto split = splitUrl(base_url, parts);
  if (auto* error = getError(split)) {
    return *error;
  }

  std::string scheme;
  if (parts.scheme == "https" || parts.scheme == "wss") {
    scheme = "wss";
  } else if (parts.scheme == "http" || parts.scheme == "ws") {
    scheme = "ws";
  } else {
    return makeError<std::string>(ErrorCode::kInvalidArgument,
                                  "Unsupported service scheme: " +
                                      parts.scheme);
  }

  std::string endpoint_path = path.empty() || path[0] != '/' ? "/" + path : path;
  return scheme + "://" + parts.authority + endpoint_path;
}

}  // namespace transport
}  // namespace chatws
