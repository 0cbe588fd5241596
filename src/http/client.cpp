#include "chatfetch/http/client.hpp"

#include "chatfetch/common/fs.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <optional>

namespace chatfetch::http {

namespace {

constexpr const char *USER_AGENT = "chatfetch/0.1";

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HeaderMap *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

struct StreamContext {
  CURL *curl = nullptr;
  HeaderMap *headers = nullptr;
  const StreamCallbacks *callbacks = nullptr;
  bool status_reported = false;
  bool aborted = false;

  bool abort_requested() {
    if (!aborted && callbacks->should_abort && callbacks->should_abort()) {
      aborted = true;
    }
    return aborted;
  }
};

size_t stream_header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  auto *context = static_cast<StreamContext *>(userdata);
  header_callback(buffer, size, nitems, context->headers);

  // A blank line terminates one header block; 1xx blocks are followed by the real one.
  const std::string line = common::trim(std::string(buffer, total));
  if (line.empty() && !context->status_reported) {
    long status = 0;
    curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 200) {
      context->status_reported = true;
      if (context->callbacks->on_status) {
        context->callbacks->on_status(static_cast<std::uint16_t>(status));
      }
    }
  }
  return total;
}

size_t stream_write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<StreamContext *>(userdata);
  if (context->abort_requested()) {
    return 0;
  }
  if (context->callbacks->on_chunk) {
    context->callbacks->on_chunk(std::string_view(ptr, total));
  }
  return total;
}

int stream_progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto *context = static_cast<StreamContext *>(userdata);
  return context->abort_requested() ? 1 : 0;
}

struct curl_slist *build_header_list(const HeaderMap &headers) {
  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  return header_list;
}

void finish_response(CURL *curl, const CURLcode code, HttpResponse &response) {
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  }
}

HttpResponse execute_request(const std::string &url, const HeaderMap &headers,
                             const std::optional<std::string> &form_body,
                             const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

  if (form_body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form_body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(form_body->size()));
  }

  struct curl_slist *header_list = build_header_list(headers);
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  finish_response(curl, code, response);

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const HeaderMap &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request(url, headers, std::nullopt, timeout_ms);
}

HttpResponse CurlHttpClient::post_form(const std::string &url, const HeaderMap &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HeaderMap with_type = headers;
  if (!with_type.contains("Content-Type")) {
    with_type["Content-Type"] = "application/x-www-form-urlencoded";
  }
  return execute_request(url, with_type, body, timeout_ms);
}

HttpResponse CurlHttpClient::get_stream(const std::string &url, const HeaderMap &headers,
                                        const StreamRequestOptions &options,
                                        const StreamCallbacks &callbacks) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  StreamContext context{.curl = curl, .headers = &response.headers, .callbacks = &callbacks};

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_ms));
  if (options.idle_timeout_ms > 0) {
    const long idle_secs = static_cast<long>((options.idle_timeout_ms + 999) / 1000);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, idle_secs);
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, stream_header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, stream_progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

  struct curl_slist *header_list = build_header_list(headers);
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  finish_response(curl, code, response);
  if (context.aborted) {
    response.aborted = true;
    response.network_error = true;
    response.network_error_message = "transfer aborted";
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

std::string url_encode_component(const std::string &value) {
  std::string out;
  out.reserve(value.size() * 3);
  for (const unsigned char ch : value) {
    const bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
                            (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.' ||
                            ch == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(ch));
      continue;
    }
    char buf[4];
    std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned int>(ch));
    out += buf;
  }
  return out;
}

} // namespace chatfetch::http
