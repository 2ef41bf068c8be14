#include "http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>

namespace chunkscribe::http {

namespace {

// curl_global_init is not thread safe; refcount it across clients.
std::mutex g_curl_mutex;
int        g_curl_refcount = 0;

bool AcquireCurlGlobal() {
  std::lock_guard<std::mutex> lock(g_curl_mutex);
  if (g_curl_refcount == 0) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      return false;
    }
  }
  ++g_curl_refcount;
  return true;
}

void ReleaseCurlGlobal() {
  std::lock_guard<std::mutex> lock(g_curl_mutex);
  if (g_curl_refcount <= 0) return;
  if (--g_curl_refcount == 0) {
    curl_global_cleanup();
  }
}

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userp) {
  auto* out = static_cast<std::string*>(userp);
  out->append(data, size * nmemb);
  return size * nmemb;
}

TransportError Classify(CURLcode code) {
  switch (code) {
    case CURLE_OK:
      return TransportError::kNone;
    case CURLE_OPERATION_TIMEDOUT:
      return TransportError::kTimeout;
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
      return TransportError::kConnect;
    default:
      return TransportError::kOther;
  }
}

} // namespace

HttpClient::HttpClient() {
  global_acquired_ = AcquireCurlGlobal();
  if (!global_acquired_) {
    throw std::runtime_error("curl_global_init failed");
  }
}

HttpClient::~HttpClient() {
  if (global_acquired_) {
    ReleaseCurlGlobal();
  }
}

HttpResponse HttpClient::Post(const HttpRequest& request) const {
  HttpResponse response;

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.transport_error   = TransportError::kOther;
    response.transport_message = "curl_easy_init failed";
    return response;
  }

  struct curl_slist* header_list = nullptr;
  for (const auto& header : request.headers) {
    header_list = curl_slist_append(header_list, header.c_str());
  }

  curl_mime* mime = nullptr;
  if (!request.multipart.empty()) {
    mime = curl_mime_init(curl);
    for (const auto& field : request.multipart) {
      curl_mimepart* part = curl_mime_addpart(mime);
      curl_mime_name(part, field.name.c_str());
      curl_mime_data(part, field.value.data(), field.value.size());
      if (!field.file_name.empty()) curl_mime_filename(part, field.file_name.c_str());
      if (!field.content_type.empty()) curl_mime_type(part, field.content_type.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
  } else {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
  }

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);

  response.transport_error = Classify(res);
  if (res != CURLE_OK) {
    response.transport_message = curl_easy_strerror(res);
  } else {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
      response.content_type = content_type;
    }
  }

  if (mime) curl_mime_free(mime);
  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  return response;
}

} // namespace chunkscribe::http
