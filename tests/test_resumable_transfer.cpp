#include <catch2/catch.hpp>

#include "fake_http_client.hpp"
#include "resumable_transfer.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace
{
const std::string kUrl = "https://dumps.example.org/other/pageviews/2024/2024-01/pageviews-2024010100.gz";
}

TEST_CASE("fresh download writes the full body", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    const std::string body = makePayload(1050);
    server.add(kUrl, FakeResource{body});
    FakeHttpClient client(server);

    std::vector<TransferProgress> reports;
    ResumableTransfer transfer(client, 100, [&reports](const TransferProgress &p) { reports.push_back(p); });

    const fs::path target = dir.path() / "pageviews-2024010100.gz";
    const TransferOutcome outcome = transfer.run(TransferTask{kUrl, target});

    CHECK(outcome.kind == TransferOutcome::Kind::Completed);
    CHECK(outcome.succeeded());
    CHECK(outcome.httpStatus == 200);
    CHECK(outcome.bytesWritten == body.size());
    CHECK(readFile(target) == body);

    // One report per full chunk, the trailing partial chunk, then the closing report
    REQUIRE(reports.size() == 12);
    CHECK(reports.front().bytesSoFar == 100);
    CHECK_FALSE(reports[10].done);
    CHECK(reports.back().done);
    CHECK(reports.back().bytesSoFar == 1050);
    REQUIRE(reports.back().totalBytes);
    CHECK(*reports.back().totalBytes == 1050);
    CHECK(reports.back().percent() == Approx(100.0));
    CHECK(reports.back().fileName == "pageviews-2024010100.gz");

    REQUIRE(server.requests().size() == 1);
    CHECK_FALSE(server.requests()[0].rangeStart);
}

TEST_CASE("an existing partial file is resumed with a range request", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    const std::string body = makePayload(5000);
    server.add(kUrl, FakeResource{body});
    FakeHttpClient client(server);

    // Prefix that differs from the remote bytes: resume must append, not rewrite
    const std::string prefix(1200, 'X');
    const fs::path target = dir.path() / "part.gz";
    writeFile(target, prefix);

    ResumableTransfer transfer(client);
    const TransferOutcome outcome = transfer.run(TransferTask{kUrl, target});

    CHECK(outcome.kind == TransferOutcome::Kind::ResumedAndCompleted);
    CHECK(outcome.httpStatus == 206);
    CHECK(outcome.bytesWritten == body.size() - prefix.size());

    const std::string local = readFile(target);
    CHECK(local.size() == body.size());
    CHECK(local.substr(0, prefix.size()) == prefix);
    CHECK(local.substr(prefix.size()) == body.substr(prefix.size()));

    REQUIRE(server.requests().size() == 1);
    REQUIRE(server.requests()[0].rangeStart);
    CHECK(*server.requests()[0].rangeStart == prefix.size());
}

TEST_CASE("416 on a range request means the file is already complete", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    const std::string body = makePayload(700);
    server.add(kUrl, FakeResource{body});
    FakeHttpClient client(server);

    const fs::path target = dir.path() / "done.gz";
    writeFile(target, body);

    bool progressed = false;
    ResumableTransfer transfer(client, 64, [&progressed](const TransferProgress &) { progressed = true; });
    const TransferOutcome outcome = transfer.run(TransferTask{kUrl, target});

    CHECK(outcome.kind == TransferOutcome::Kind::AlreadyComplete);
    CHECK(outcome.succeeded());
    CHECK(outcome.httpStatus == 416);
    CHECK(outcome.bytesWritten == 0);
    CHECK(readFile(target) == body);
    CHECK_FALSE(progressed);
}

TEST_CASE("a server that ignores the range restarts the file", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    FakeResource resource;
    resource.body = makePayload(3000, 'k');
    resource.honorsRange = false;
    server.add(kUrl, resource);
    FakeHttpClient client(server);

    const fs::path target = dir.path() / "restart.gz";
    writeFile(target, std::string(900, 'Z'));

    ResumableTransfer transfer(client);
    const TransferOutcome outcome = transfer.run(TransferTask{kUrl, target});

    CHECK(outcome.kind == TransferOutcome::Kind::Completed);
    CHECK(outcome.httpStatus == 200);
    CHECK(readFile(target) == resource.body);
}

TEST_CASE("resume disabled downloads from scratch", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    const std::string body = makePayload(400);
    server.add(kUrl, FakeResource{body});
    FakeHttpClient client(server);

    const fs::path target = dir.path() / "fresh.gz";
    writeFile(target, "stale");

    TransferTask task{kUrl, target};
    task.resume = false;

    ResumableTransfer transfer(client);
    const TransferOutcome outcome = transfer.run(task);

    CHECK(outcome.kind == TransferOutcome::Kind::Completed);
    CHECK(readFile(target) == body);
    REQUIRE(server.requests().size() == 1);
    CHECK_FALSE(server.requests()[0].rangeStart);
}

TEST_CASE("HTTP errors fail without touching the local file", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    FakeHttpClient client(server);
    ResumableTransfer transfer(client);

    SECTION("404 is a server rejection")
    {
        const fs::path target = dir.path() / "missing.gz";
        const TransferOutcome outcome = transfer.run(TransferTask{kUrl, target});

        CHECK(outcome.kind == TransferOutcome::Kind::Failed);
        CHECK(outcome.errorKind == ErrorKind::ServerRejection);
        CHECK(outcome.httpStatus == 404);
        CHECK(outcome.reason == "HTTP error 404: Not Found");
        CHECK_FALSE(fs::exists(target));
    }

    SECTION("503 is transient and keeps the partial prefix")
    {
        FakeResource resource;
        resource.body = makePayload(100);
        resource.status = 503;
        server.add(kUrl, resource);

        const fs::path target = dir.path() / "busy.gz";
        writeFile(target, "prefix");
        const TransferOutcome outcome = transfer.run(TransferTask{kUrl, target});

        CHECK(outcome.errorKind == ErrorKind::TransientNetwork);
        CHECK(outcome.httpStatus == 503);
        CHECK(readFile(target) == "prefix");
    }
}

TEST_CASE("a dropped connection keeps the bytes received so far", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    FakeResource resource;
    resource.body = makePayload(4000);
    resource.dropAfter = 2500;
    server.add(kUrl, resource);
    FakeHttpClient client(server);

    const fs::path target = dir.path() / "dropped.gz";
    ResumableTransfer transfer(client, 1024);

    const TransferOutcome first = transfer.run(TransferTask{kUrl, target});
    CHECK(first.kind == TransferOutcome::Kind::Failed);
    CHECK(first.errorKind == ErrorKind::TransientNetwork);
    CHECK(first.bytesWritten == 2500);
    CHECK(readFile(target) == resource.body.substr(0, 2500));

    // The next run picks up where the drop left off
    resource.dropAfter.reset();
    server.add(kUrl, resource);

    const TransferOutcome second = transfer.run(TransferTask{kUrl, target});
    CHECK(second.kind == TransferOutcome::Kind::ResumedAndCompleted);
    CHECK(second.bytesWritten == 1500);
    CHECK(readFile(target) == resource.body);
}

TEST_CASE("a transport failure before any response fails cleanly", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    FakeResource resource;
    resource.failTransport = true;
    server.add(kUrl, resource);
    FakeHttpClient client(server);

    const fs::path target = dir.path() / "refused.gz";
    ResumableTransfer transfer(client);
    const TransferOutcome outcome = transfer.run(TransferTask{kUrl, target});

    CHECK(outcome.kind == TransferOutcome::Kind::Failed);
    CHECK(outcome.errorKind == ErrorKind::TransientNetwork);
    CHECK(outcome.reason == "Couldn't connect to server");
    CHECK_FALSE(fs::exists(target));
}

TEST_CASE("without a Content-Length the percentage is unknown", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    FakeResource resource;
    resource.body = makePayload(300);
    resource.declareLength = false;
    server.add(kUrl, resource);
    FakeHttpClient client(server);

    std::vector<TransferProgress> reports;
    ResumableTransfer transfer(client, 128, [&reports](const TransferProgress &p) { reports.push_back(p); });
    const TransferOutcome outcome = transfer.run(TransferTask{kUrl, dir.path() / "unsized.gz"});

    CHECK(outcome.kind == TransferOutcome::Kind::Completed);
    REQUIRE_FALSE(reports.empty());
    for (const auto &report : reports)
    {
        CHECK_FALSE(report.totalBytes);
        CHECK_FALSE(report.percent());
    }
    CHECK(reports.back().bytesSoFar == 300);
    CHECK(reports.back().done);
}

TEST_CASE("a failed transfer still sends a closing progress report", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    FakeResource resource;
    resource.body = makePayload(900);
    resource.dropAfter = 500;
    server.add(kUrl, resource);
    FakeHttpClient client(server);

    std::vector<TransferProgress> reports;
    ResumableTransfer transfer(client, 100, [&reports](const TransferProgress &p) { reports.push_back(p); });
    const TransferOutcome outcome = transfer.run(TransferTask{kUrl, dir.path() / "cut.gz"});

    CHECK(outcome.kind == TransferOutcome::Kind::Failed);
    REQUIRE(reports.size() == 6);
    CHECK(reports.back().done);
    CHECK(reports.back().bytesSoFar == 500);
}

TEST_CASE("an unwritable target is a local I/O failure", "[transfer]")
{
    TempDir dir;
    FakeServer server;
    server.add(kUrl, FakeResource{makePayload(10)});
    FakeHttpClient client(server);

    // A directory in place of the file cannot be opened for writing
    const fs::path target = dir.path() / "occupied";
    fs::create_directories(target);

    TransferTask task{kUrl, target};
    task.resume = false;

    ResumableTransfer transfer(client);
    const TransferOutcome outcome = transfer.run(task);

    CHECK(outcome.kind == TransferOutcome::Kind::Failed);
    CHECK(outcome.errorKind == ErrorKind::LocalIO);
}

TEST_CASE("disk space check", "[transfer]")
{
    TempDir dir;
    std::string error;

    CHECK(ResumableTransfer::checkDiskSpace(dir.path() / "x.gz", 0, error));
    CHECK(ResumableTransfer::checkDiskSpace(dir.path() / "x.gz", 1024, error));
    CHECK(error.empty());

    CHECK_FALSE(ResumableTransfer::checkDiskSpace(dir.path() / "x.gz", std::numeric_limits<std::uint64_t>::max() / 2, error));
    CHECK_THAT(error, Catch::Contains("Insufficient disk space"));
}

TEST_CASE("outcome kind names", "[transfer]")
{
    CHECK(outcomeKindName(TransferOutcome::Kind::Completed) == "completed");
    CHECK(outcomeKindName(TransferOutcome::Kind::ResumedAndCompleted) == "resumed");
    CHECK(outcomeKindName(TransferOutcome::Kind::AlreadyComplete) == "already-complete");
    CHECK(outcomeKindName(TransferOutcome::Kind::Failed) == "failed");
}
