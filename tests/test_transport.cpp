#include "test_framework.hpp"

#include "chatfetch/config/schema.hpp"
#include "chatfetch/stream/http_transport.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <thread>

namespace {

namespace stream = chatfetch::stream;
namespace testing = chatfetch::testing;

stream::HttpTransportOptions local_options() {
  stream::HttpTransportOptions options;
  options.server_address = "http://127.0.0.1:8080";
  return options;
}

const stream::Cursor kCursor{"chat-1", std::nullopt};

} // namespace

void register_transport_tests(std::vector<chatfetch::tests::TestCase> &tests) {
  using chatfetch::tests::require;
  namespace auth = chatfetch::auth;

  tests.push_back({"build_stream_url_fresh_start", [] {
                     stream::HttpTransportOptions options;
                     options.server_address = "http://host:1/";
                     const auto url =
                         stream::build_stream_url(options, stream::Cursor{"chat 1", std::nullopt});
                     require(url == "http://host:1/youtube/v3/liveChat/messages/stream"
                                    "?liveChatId=chat%201&part=snippet&part=authorDetails",
                             "unexpected url: " + url);
                     require(url.find("pageToken") == std::string::npos,
                             "fresh start carries no page token");
                   }});

  tests.push_back({"build_stream_url_with_token_and_options", [] {
                     chatfetch::config::StreamConfig config;
                     config.server_address = "https://yt.example";
                     config.parts = {"snippet"};
                     config.max_results = 200;
                     config.hl = "en";
                     config.profile_image_size = 64;
                     const auto options = stream::HttpTransportOptions::from_config(config);
                     require(options.connect_timeout_ms == 10000, "timeouts converted to ms");

                     const auto url = stream::build_stream_url(
                         options, stream::Cursor{"chat-1", std::string("a/b+c")});
                     require(url.find("&pageToken=a%2Fb%2Bc") != std::string::npos,
                             "token must be percent-encoded: " + url);
                     require(url.find("&maxResults=200") != std::string::npos, "maxResults");
                     require(url.find("&hl=en") != std::string::npos, "hl");
                     require(url.find("&profileImageSize=64") != std::string::npos,
                             "profileImageSize");
                     require(url.find("part=authorDetails") == std::string::npos,
                             "only configured parts");
                   }});

  tests.push_back({"http_transport_streams_batches_then_end", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     testing::StreamScript script;
                     script.chunks = {testing::batch_json("chat-1", std::string("a")) + "\n" +
                                          testing::batch_json("chat-1", std::string("b")).substr(0, 20),
                                      testing::batch_json("chat-1", std::string("b")).substr(20) +
                                          "\n"};
                     http.push_stream(script);

                     stream::HttpTransport transport(http, local_options(), gate);
                     auto opened = transport.open(kCursor, auth::Credential::bearer("tok"));
                     require(opened.ok(), opened.error().to_string());
                     auto &session = *opened.value();

                     const auto first = session.next();
                     require(first.kind == stream::SessionEventKind::Batch, "first is a batch");
                     require(first.batch->page_token == "a", "first token");
                     const auto second = session.next();
                     require(second.kind == stream::SessionEventKind::Batch, "second is a batch");
                     require(second.batch->page_token == "b", "split batch reassembled");
                     const auto end = session.next();
                     require(end.kind == stream::SessionEventKind::EndOfStream,
                             "clean close is end of stream");

                     const auto requests = http.requests();
                     require(requests.size() == 1, "one request");
                     require(requests[0].headers.at("Authorization") == "Bearer tok",
                             "bearer header applied");
                   }});

  tests.push_back({"http_transport_api_key_header", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     http.push_stream(testing::StreamScript{});
                     stream::HttpTransport transport(http, local_options(), gate);
                     auto opened = transport.open(kCursor, auth::Credential::api_key("k-1"));
                     require(opened.ok(), opened.error().to_string());
                     const auto requests = http.requests();
                     require(requests[0].headers.at("x-goog-api-key") == "k-1", "api key header");
                     require(!requests[0].headers.contains("Authorization"), "no bearer header");
                   }});

  tests.push_back({"http_transport_rejected_status_is_connect_error", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     testing::StreamScript script;
                     script.status = 401;
                     script.chunks = {R"({"error":{"code":401}})"};
                     http.push_stream(script);

                     stream::HttpTransport transport(http, local_options(), gate);
                     const auto opened = transport.open(kCursor, auth::Credential::none());
                     require(!opened.ok(), "401 must fail the open");
                     require(opened.error().kind == stream::ErrorKind::Connect, "ConnectError");
                     require(opened.error().message.find("authentication failed (HTTP 401)") !=
                                 std::string::npos,
                             "message: " + opened.error().message);
                     require(opened.error().message.find("\"code\":401") != std::string::npos,
                             "error body included");
                   }});

  tests.push_back({"http_transport_server_error_is_connect_error", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     testing::StreamScript script;
                     script.status = 503;
                     http.push_stream(script);
                     stream::HttpTransport transport(http, local_options(), gate);
                     const auto opened = transport.open(kCursor, auth::Credential::none());
                     require(!opened.ok(), "503 must fail the open");
                     require(opened.error().message == "server returned HTTP 503",
                             "message: " + opened.error().message);
                   }});

  tests.push_back({"http_transport_unreachable_is_connect_error", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     stream::HttpTransport transport(http, local_options(), gate);
                     const auto opened = transport.open(kCursor, auth::Credential::none());
                     require(!opened.ok(), "refused connection must fail");
                     require(opened.error().kind == stream::ErrorKind::Connect, "ConnectError");
                     require(opened.error().message.find("connection refused") != std::string::npos,
                             "message: " + opened.error().message);
                   }});

  tests.push_back({"http_transport_midstream_failure", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     testing::StreamScript script;
                     script.chunks = {testing::batch_json("chat-1", std::string("a")) + "\n"};
                     script.network_error = true;
                     http.push_stream(script);

                     stream::HttpTransport transport(http, local_options(), gate);
                     auto opened = transport.open(kCursor, auth::Credential::none());
                     require(opened.ok(), opened.error().to_string());
                     auto &session = *opened.value();
                     require(session.next().kind == stream::SessionEventKind::Batch, "batch first");
                     const auto failure = session.next();
                     require(failure.kind == stream::SessionEventKind::TransportError,
                             "reset is a transport error");
                     require(failure.error.find("connection reset") != std::string::npos,
                             "message: " + failure.error);
                   }});

  tests.push_back({"http_transport_close_inside_object", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     testing::StreamScript script;
                     script.chunks = {"{\"nextPageToken\":\"a\",\"items\":["};
                     http.push_stream(script);

                     stream::HttpTransport transport(http, local_options(), gate);
                     auto opened = transport.open(kCursor, auth::Credential::none());
                     require(opened.ok(), opened.error().to_string());
                     const auto event = opened.value()->next();
                     require(event.kind == stream::SessionEventKind::TransportError,
                             "truncated batch is a transport error");
                     require(event.error.find("middle of a batch") != std::string::npos,
                             "message: " + event.error);
                   }});

  tests.push_back({"http_transport_undecodable_batch", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     testing::StreamScript script;
                     script.chunks = {testing::batch_json("chat-1", std::string("a")) +
                                      "\n{\"items\":\"bogus\"}\n"};
                     script.hold_open = true;
                     http.push_stream(script);

                     stream::HttpTransport transport(http, local_options(), gate);
                     auto opened = transport.open(kCursor, auth::Credential::none());
                     require(opened.ok(), opened.error().to_string());
                     auto &session = *opened.value();
                     require(session.next().kind == stream::SessionEventKind::Batch,
                             "valid batch delivered first");
                     const auto event = session.next();
                     require(event.kind == stream::SessionEventKind::TransportError,
                             "bad batch ends the session");
                     require(event.error.find("undecodable batch") != std::string::npos,
                             "message: " + event.error);
                   }});

  tests.push_back({"http_transport_cancellation_interrupts_next", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     testing::StreamScript script;
                     script.hold_open = true;
                     http.push_stream(script);

                     stream::HttpTransport transport(http, local_options(), gate);
                     auto opened = transport.open(kCursor, auth::Credential::none());
                     require(opened.ok(), opened.error().to_string());

                     std::thread trigger([&gate]() {
                       std::this_thread::sleep_for(std::chrono::milliseconds(30));
                       gate.trigger("SIGINT");
                     });
                     const auto event = opened.value()->next();
                     trigger.join();
                     require(event.kind == stream::SessionEventKind::Interrupted,
                             "blocked next() must return Interrupted");

                     opened.value().reset();
                     require(http.stream_calls() == 1, "session released");
                   }});

  tests.push_back({"http_transport_open_after_cancel_fails", [] {
                     testing::FakeHttpClient http;
                     stream::CancellationGate gate;
                     gate.trigger("SIGTERM");
                     testing::StreamScript script;
                     script.hold_open = true;
                     http.push_stream(script);

                     stream::HttpTransport transport(http, local_options(), gate);
                     const auto opened = transport.open(kCursor, auth::Credential::none());
                     require(!opened.ok(), "open on a cancelled gate must fail");
                     require(opened.error().message == "connection attempt cancelled",
                             "message: " + opened.error().message);
                   }});
}
