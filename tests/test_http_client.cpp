#include <catch2/catch.hpp>

#include "curl_http_client.hpp"
#include "fake_http_client.hpp"

TEST_CASE("HTTP status classification", "[http]")
{
    CHECK(classifyHttpStatus(200) == ErrorKind::None);
    CHECK(classifyHttpStatus(206) == ErrorKind::None);
    CHECK(classifyHttpStatus(404) == ErrorKind::ServerRejection);
    CHECK(classifyHttpStatus(403) == ErrorKind::ServerRejection);
    CHECK(classifyHttpStatus(416) == ErrorKind::ServerRejection);
    CHECK(classifyHttpStatus(302) == ErrorKind::ServerRejection);
    CHECK(classifyHttpStatus(500) == ErrorKind::TransientNetwork);
    CHECK(classifyHttpStatus(503) == ErrorKind::TransientNetwork);
}

TEST_CASE("HTTP status text", "[http]")
{
    CHECK(httpStatusText(200) == "OK");
    CHECK(httpStatusText(206) == "Partial Content");
    CHECK(httpStatusText(404) == "Not Found");
    CHECK(httpStatusText(416) == "Range Not Satisfiable");
    CHECK(httpStatusText(503) == "Service Unavailable");
    CHECK(httpStatusText(799) == "Unknown Status");
}

TEST_CASE("curl error classification", "[http][curl]")
{
    CHECK(CurlHttpClient::classifyError(CURLE_OK) == ErrorKind::None);
    CHECK(CurlHttpClient::classifyError(CURLE_COULDNT_CONNECT) == ErrorKind::TransientNetwork);
    CHECK(CurlHttpClient::classifyError(CURLE_COULDNT_RESOLVE_HOST) == ErrorKind::TransientNetwork);
    CHECK(CurlHttpClient::classifyError(CURLE_OPERATION_TIMEDOUT) == ErrorKind::TransientNetwork);
    CHECK(CurlHttpClient::classifyError(CURLE_PARTIAL_FILE) == ErrorKind::TransientNetwork);
    CHECK(CurlHttpClient::classifyError(CURLE_ABORTED_BY_CALLBACK) == ErrorKind::Interrupted);
    CHECK(CurlHttpClient::classifyError(CURLE_URL_MALFORMAT) == ErrorKind::MalformedInput);
    CHECK(CurlHttpClient::classifyError(CURLE_WRITE_ERROR) == ErrorKind::LocalIO);
}

TEST_CASE("curl client reports an unsupported scheme without touching the network", "[http][curl]")
{
    ensureCurlInitialized();
    CurlHttpClient client;

    std::string body;
    CHECK_FALSE(client.fetchText("gopherx://example.invalid/", body));
    CHECK_FALSE(client.getLastError().empty());
}

TEST_CASE("fetchText collects a 2xx body", "[http]")
{
    FakeServer server;
    server.addPage("https://h/index/", "<a href=\"2024/\">2024/</a>");
    FakeHttpClient client(server);

    std::string body;
    REQUIRE(client.fetchText("https://h/index/", body));
    CHECK(body == "<a href=\"2024/\">2024/</a>");
    CHECK(client.getLastError().empty());
}

TEST_CASE("fetchText fails on error statuses and transport errors", "[http]")
{
    FakeServer server;
    FakeResource down;
    down.failTransport = true;
    server.add("https://h/down/", down);
    FakeHttpClient client(server);

    std::string body;
    CHECK_FALSE(client.fetchText("https://h/missing/", body));
    CHECK_THAT(client.getLastError(), Catch::Contains("404"));

    CHECK_FALSE(client.fetchText("https://h/down/", body));
    CHECK_THAT(client.getLastError(), Catch::Contains("Couldn't connect"));
}
