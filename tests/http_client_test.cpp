#include "fixloop/client/http/http_client.hpp"
#include "fixloop/client/http/http_parser.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::http;
using namespace fixloop::test;
using namespace std::chrono_literals;

TEST(HttpParserTest, ParsesContentLengthResponse) {
  HttpResponseParser parser;

  auto resp = parser.parse(
      "HTTP/1.1 201 Created\r\nContent-Type: application/json\r\n"
      "Content-Length: 11\r\n\r\n{\"Id\":\"ab\"}");

  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->status, 201);
  EXPECT_EQ(resp->body, "{\"Id\":\"ab\"}");
  EXPECT_EQ(resp->header("content-type"), "application/json");
}

TEST(HttpParserTest, ParsesIncrementalChunkedResponse) {
  HttpResponseParser parser;

  EXPECT_FALSE(parser.parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n")
                   .has_value());
  EXPECT_FALSE(parser.parse("\r\n5\r\nhello\r\n").has_value());
  auto resp = parser.parse("6\r\n world\r\n0\r\n\r\n");

  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->body, "hello world");
}

TEST(HttpParserTest, CloseDelimitedBody_CompletesOnFinish) {
  HttpResponseParser parser;

  EXPECT_FALSE(parser.parse("HTTP/1.1 200 OK\r\n\r\npartial body").has_value());
  auto resp = parser.finish();

  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->body, "partial body");
}

TEST(HttpParserTest, Garbage_MarksFailed) {
  HttpResponseParser parser;

  EXPECT_FALSE(parser.parse("NOT HTTP AT ALL\r\n\r\n").has_value());
  EXPECT_TRUE(parser.failed());

  parser.reset();
  EXPECT_FALSE(parser.failed());
}

TEST(HttpTypesTest, ParseUrl) {
  auto https = parse_url("https://api.example.com/v1");
  ASSERT_TRUE(https.has_value());
  EXPECT_EQ(https->scheme, "https");
  EXPECT_EQ(https->host, "api.example.com");
  EXPECT_EQ(https->port, 443);
  EXPECT_EQ(https->path, "/v1");

  auto local = parse_url("http://127.0.0.1:8080");
  ASSERT_TRUE(local.has_value());
  EXPECT_EQ(local->port, 8080);
  EXPECT_EQ(local->path, "");

  EXPECT_FALSE(parse_url("ftp://example.com").has_value());
  EXPECT_FALSE(parse_url("example.com").has_value());
  EXPECT_FALSE(parse_url("http://:80").has_value());
  EXPECT_FALSE(parse_url("http://host:99999").has_value());
}

TEST(HttpTypesTest, Serialize_AddsDefaultHeaders) {
  HttpRequest req{
      .method = HttpMethod::POST, .path = "/x", .headers = {}, .body = "abc"};

  auto wire = req.serialize("example.com");

  EXPECT_TRUE(wire.starts_with("POST /x HTTP/1.1\r\n"));
  EXPECT_NE(wire.find("Host: example.com\r\n"), std::string::npos);
  EXPECT_NE(wire.find("Content-Length: 3\r\n"), std::string::npos);
  EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
  EXPECT_TRUE(wire.ends_with("\r\n\r\nabc"));
}

TEST(HttpClientTest, PostJson_RoundTripsOverTcp) {
  StubHttpServer server([](const StubRequest& req) {
    return StubResponse{.status = 200, .body = "echo:" + req.body};
  });
  auto url = parse_url(server.url());
  ASSERT_TRUE(url.has_value());
  HttpClient client(Endpoint::from_url(*url));

  HttpHeaders headers;
  headers["Authorization"] = "Bearer k";
  auto resp = client.post_json("/v1/chat", R"({"a":1})", std::move(headers));

  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->status, 200);
  EXPECT_EQ(resp->body, R"(echo:{"a":1})");
  auto seen = server.requests();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].method, "POST");
  EXPECT_EQ(seen[0].path, "/v1/chat");
  EXPECT_NE(seen[0].headers.find("Authorization: Bearer k"), std::string::npos);
}

TEST(HttpClientTest, Get_OverUnixSocket) {
  TempDir dir;
  auto socket_path = (dir.path() / "stub.sock").string();
  StubHttpServer server(
      [](const StubRequest&) { return StubResponse{.status = 200, .body = "OK"}; },
      socket_path);
  HttpClient client(Endpoint::unix_socket(socket_path));

  auto resp = client.get("/_ping");

  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->body, "OK");
}

TEST(HttpClientTest, ConnectFailsForNonExistentSocket) {
  HttpClient client(
      Endpoint::unix_socket("/tmp/fixloop_nonexistent_socket_12345.sock"));

  auto resp = client.get("/");

  ASSERT_FALSE(resp.has_value());
  EXPECT_EQ(resp.error(), HttpError::ConnectFailed);
}

TEST(HttpClientTest, ResponseLargerThanLimit_IsRejected) {
  StubHttpServer server([](const StubRequest&) {
    return StubResponse{.status = 200, .body = std::string(4096, 'x')};
  });
  auto url = parse_url(server.url());
  ASSERT_TRUE(url.has_value());
  HttpClient client(Endpoint::from_url(*url),
                    HttpClientConfig{.connect_timeout = 5s,
                                     .read_timeout = 5s,
                                     .max_response_size = 1024});

  auto resp = client.get("/");

  ASSERT_FALSE(resp.has_value());
  EXPECT_EQ(resp.error(), HttpError::ResponseTooLarge);
}
