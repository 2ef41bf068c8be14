#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkscribe::http {

struct MultipartField {
  std::string name;
  std::string value;
  // set for file parts
  std::string file_name;
  std::string content_type;
};

struct HttpRequest {
  std::string              url;
  std::vector<std::string> headers;

  // Exactly one of body / multipart is used; multipart wins when non-empty.
  std::string                 body;
  std::vector<MultipartField> multipart;

  std::chrono::milliseconds timeout{30'000};
};

enum class TransportError {
  kNone,
  kTimeout,
  kConnect,
  kOther,
};

struct HttpResponse {
  TransportError transport_error = TransportError::kNone;
  std::string    transport_message;

  long        status_code = 0;
  std::string body;
  std::string content_type;

  bool Ok() const {
    return transport_error == TransportError::kNone && status_code >= 200 && status_code < 300;
  }
};

/*
  Blocking HTTP POST over libcurl.

  Never throws for network or HTTP failures; those come back in the
  response so callers can classify them.
*/
class HttpClient {
 public:
  HttpClient();
  ~HttpClient();

  HttpClient(const HttpClient&)            = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse Post(const HttpRequest& request) const;

 private:
  bool global_acquired_ = false;
};

} // namespace chunkscribe::http
