#include "rangeget/curl_transport.hpp"
#include "rangeget/chunk.hpp"
#include "rangeget/range_downloader.hpp"

#include "fake_transport.hpp"
#include "loopback_server.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using rangeget::BodySink;
using rangeget::ByteRange;
using rangeget::CancellationToken;
using rangeget::CurlTransport;
using rangeget::FetchRequest;
using rangeget::test::HttpRequest;
using rangeget::test::HttpResponse;
using rangeget::test::LoopbackServer;
using rangeget::test::TempDir;

namespace {

const char* const kUserAgent = "rangeget-test/1.0";

// Proxy settings of the environment must not apply to loopback requests.
void bypassProxies() {
    ::setenv("no_proxy", "*", 1);
    ::setenv("NO_PROXY", "*", 1);
}

CurlTransport makeTransport() {
    bypassProxies();
    return CurlTransport(CurlTransport::Settings{kUserAgent, 16 * 1024, 5, 10});
}

std::string makeBody(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = rangeget::test::FakeTransport::byteAt(i);
    }
    return body;
}

// Serves `body` like a static file server, honouring single byte ranges when
// `ranges` is set.
HttpResponse serveResource(const HttpRequest& request, const std::string& body, bool ranges) {
    HttpResponse response;
    if (ranges) {
        response.headers.emplace_back("Accept-Ranges", "bytes");
    }
    if (request.method == "HEAD") {
        response.content_length = body.size();
        return response;
    }

    const std::string range = request.header("range");
    if (ranges && range.rfind("bytes=", 0) == 0) {
        const auto dash = range.find('-');
        const std::uint64_t start = std::stoull(range.substr(6, dash - 6));
        const std::uint64_t end = std::min<std::uint64_t>(std::stoull(range.substr(dash + 1)), body.size() - 1);
        response.status = 206;
        response.headers.emplace_back("Content-Range", "bytes " + std::to_string(start) + "-" +
                                                           std::to_string(end) + "/" +
                                                           std::to_string(body.size()));
        response.body = body.substr(start, end - start + 1);
        return response;
    }
    response.body = body;
    return response;
}

struct Collector {
    std::string data;
    BodySink sink() {
        return [this](const char* bytes, std::size_t size) {
            data.append(bytes, size);
            return true;
        };
    }
};

} // namespace

TEST_CASE("The probe reports length, range support and sends the job headers", "[curl]") {
    const std::string body = makeBody(3000);
    LoopbackServer server([&body](const HttpRequest& request) { return serveResource(request, body, true); });
    auto transport = makeTransport();
    CancellationToken cancel;

    const auto probe = transport.probe(server.url("/file.bin"), "Bearer secret", cancel);

    REQUIRE(probe.ok);
    CHECK(probe.status_code == 200);
    REQUIRE(probe.content_length);
    CHECK(*probe.content_length == 3000);
    CHECK(probe.accepts_ranges);

    const auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "HEAD");
    CHECK(requests[0].header("authorization") == "Bearer secret");
    CHECK(requests[0].header("user-agent") == kUserAgent);
}

TEST_CASE("Only the final response of a redirect chain decides range support", "[curl]") {
    const std::string body = makeBody(1000);
    auto transport = makeTransport();
    CancellationToken cancel;

    SECTION("the redirect advertises ranges, the target does not") {
        LoopbackServer server([&body](const HttpRequest& request) {
            if (request.path == "/start") {
                HttpResponse redirect;
                redirect.status = 302;
                redirect.headers.emplace_back("Location", "/final");
                redirect.headers.emplace_back("Accept-Ranges", "bytes");
                return redirect;
            }
            return serveResource(request, body, false);
        });

        const auto probe = transport.probe(server.url("/start"), "", cancel);
        REQUIRE(probe.ok);
        CHECK_FALSE(probe.accepts_ranges);
        REQUIRE(probe.content_length);
        CHECK(*probe.content_length == 1000);
        CHECK(server.requests().size() == 2);
    }

    SECTION("the target advertises ranges") {
        LoopbackServer server([&body](const HttpRequest& request) {
            if (request.path == "/start") {
                HttpResponse redirect;
                redirect.status = 302;
                redirect.headers.emplace_back("Location", "/final");
                return redirect;
            }
            return serveResource(request, body, true);
        });

        const auto probe = transport.probe(server.url("/start"), "", cancel);
        REQUIRE(probe.ok);
        CHECK(probe.accepts_ranges);
    }
}

TEST_CASE("An error status on the probe is reported with its code", "[curl]") {
    LoopbackServer server([](const HttpRequest&) {
        HttpResponse response;
        response.status = 403;
        return response;
    });
    auto transport = makeTransport();
    CancellationToken cancel;

    const auto probe = transport.probe(server.url("/private"), "", cancel);

    CHECK_FALSE(probe.ok);
    CHECK(probe.status_code == 403);
    CHECK(probe.error.find("HEAD request failed") != std::string::npos);
}

TEST_CASE("A ranged fetch sends an inclusive Range header and delivers the slice", "[curl]") {
    const std::string body = makeBody(5000);
    LoopbackServer server([&body](const HttpRequest& request) { return serveResource(request, body, true); });
    auto transport = makeTransport();
    CancellationToken cancel;
    Collector collector;

    const FetchRequest request{server.url("/file.bin"), "Bearer secret", ByteRange{1000, 1999}};
    const auto result = transport.fetch(request, collector.sink(), cancel);

    REQUIRE(result.ok);
    CHECK(result.status_code == 206);
    CHECK(collector.data == body.substr(1000, 1000));

    const auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "GET");
    CHECK(requests[0].header("range") == "bytes=1000-1999");
    CHECK(requests[0].header("authorization") == "Bearer secret");
}

TEST_CASE("A ranged fetch follows redirects", "[curl]") {
    const std::string body = makeBody(4096);
    LoopbackServer server([&body](const HttpRequest& request) {
        if (request.path == "/moved") {
            HttpResponse redirect;
            redirect.status = 302;
            redirect.headers.emplace_back("Location", "/file.bin");
            return redirect;
        }
        return serveResource(request, body, true);
    });
    auto transport = makeTransport();
    CancellationToken cancel;
    Collector collector;

    const auto result =
        transport.fetch(FetchRequest{server.url("/moved"), "", ByteRange{96, 4095}}, collector.sink(), cancel);

    REQUIRE(result.ok);
    CHECK(result.status_code == 206);
    CHECK(collector.data == body.substr(96));
}

TEST_CASE("A 200 answer is accepted for a range starting at zero", "[curl]") {
    const std::string body = makeBody(800);
    LoopbackServer server([&body](const HttpRequest& request) { return serveResource(request, body, false); });
    auto transport = makeTransport();
    CancellationToken cancel;
    Collector collector;

    const auto result =
        transport.fetch(FetchRequest{server.url("/file.bin"), "", ByteRange{0, 799}}, collector.sink(), cancel);

    REQUIRE(result.ok);
    CHECK(result.status_code == 200);
    CHECK(collector.data == body);
}

TEST_CASE("A 200 answer to a later range never reaches the sink", "[curl]") {
    const std::string body = makeBody(800);
    LoopbackServer server([&body](const HttpRequest& request) { return serveResource(request, body, false); });
    auto transport = makeTransport();
    CancellationToken cancel;
    Collector collector;

    const auto result =
        transport.fetch(FetchRequest{server.url("/file.bin"), "", ByteRange{400, 799}}, collector.sink(), cancel);

    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.retryable);
    CHECK(result.status_code == 200);
    CHECK(result.error.find("ignored the range") != std::string::npos);
    CHECK(collector.data.empty());
}

TEST_CASE("Error statuses fail the fetch without a body", "[curl]") {
    LoopbackServer server([](const HttpRequest&) {
        HttpResponse response;
        response.status = 503;
        response.body = "try again later";
        return response;
    });
    auto transport = makeTransport();
    CancellationToken cancel;
    Collector collector;

    const auto result =
        transport.fetch(FetchRequest{server.url("/busy"), "", ByteRange{0, 99}}, collector.sink(), cancel);

    CHECK_FALSE(result.ok);
    CHECK(result.retryable);
    CHECK(result.status_code == 503);
    CHECK(result.error.find("503") != std::string::npos);
    CHECK(collector.data.empty());
}

TEST_CASE("A whole-resource fetch accepts 200 only", "[curl]") {
    auto transport = makeTransport();
    CancellationToken cancel;

    SECTION("partial content is refused before the sink sees it") {
        LoopbackServer server([](const HttpRequest&) {
            HttpResponse response;
            response.status = 206;
            response.body = "partial";
            return response;
        });
        Collector collector;

        const auto result = transport.fetch(FetchRequest{server.url("/file"), "", std::nullopt}, collector.sink(), cancel);

        CHECK_FALSE(result.ok);
        CHECK(result.error == "unexpected status code: 206");
        CHECK(collector.data.empty());
    }

    SECTION("an empty success without 200 is refused") {
        LoopbackServer server([](const HttpRequest&) {
            HttpResponse response;
            response.status = 204;
            return response;
        });
        Collector collector;

        const auto result = transport.fetch(FetchRequest{server.url("/file"), "", std::nullopt}, collector.sink(), cancel);

        CHECK_FALSE(result.ok);
        CHECK(result.error == "unexpected status code: 204");
    }
}

TEST_CASE("A sink refusing data aborts the transfer", "[curl]") {
    const std::string body = makeBody(64 * 1024);
    LoopbackServer server([&body](const HttpRequest& request) { return serveResource(request, body, true); });
    auto transport = makeTransport();
    CancellationToken cancel;

    const BodySink refuse = [](const char*, std::size_t) { return false; };
    const auto result = transport.fetch(FetchRequest{server.url("/file.bin"), "", std::nullopt}, refuse, cancel);

    CHECK_FALSE(result.ok);
    CHECK(result.error == "transfer aborted by receiver");
}

TEST_CASE("Cancelling aborts a slow body promptly", "[curl]") {
    const std::string body = makeBody(4 * 1024 * 1024);
    LoopbackServer server([&body](const HttpRequest&) {
        HttpResponse response;
        response.body = body;
        response.piece_size = 4 * 1024;
        response.piece_delay = 20ms;
        return response;
    });
    auto transport = makeTransport();
    CancellationToken cancel;
    Collector collector;

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(200ms);
        cancel.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    const auto result = transport.fetch(FetchRequest{server.url("/slow"), "", std::nullopt}, collector.sink(), cancel);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    CHECK(result.cancelled);
    CHECK_FALSE(result.ok);
    CHECK(elapsed < 5s);
    CHECK(collector.data.size() < body.size());
}

TEST_CASE("A job downloads from a real HTTP server with parallel ranges", "[curl][downloader]") {
    const std::string body = makeBody(3000017);
    LoopbackServer server([&body](const HttpRequest& request) { return serveResource(request, body, true); });
    bypassProxies();
    TempDir dir;

    rangeget::TransferJob job;
    job.url = server.url("/archive.bin");
    job.destination = (dir.path() / "archive.bin").string();
    job.options.stream_count = 4;
    job.options.chunk_size = 256 * 1024;
    job.options.buffer_size = 16 * 1024;
    job.options.retry.base_delay = 1ms;

    rangeget::RangeDownloader downloader(job);
    const auto result = downloader.run();

    REQUIRE(result.ok());
    CHECK_FALSE(result.used_fallback);
    CHECK(result.bytes_transferred == body.size());

    const auto content = rangeget::test::readFile(job.destination);
    REQUIRE(content.size() == body.size());
    CHECK(std::equal(content.begin(), content.end(), body.begin()));

    const auto plan = rangeget::planChunks(body.size(), 4, 256 * 1024);
    const auto requests = server.requests();
    CHECK(std::count_if(requests.begin(), requests.end(),
                        [](const HttpRequest& request) { return request.method == "HEAD"; }) == 1);
    CHECK(std::count_if(requests.begin(), requests.end(), [](const HttpRequest& request) {
              return request.method == "GET" && !request.header("range").empty();
          }) == static_cast<long>(plan.size()));
}
