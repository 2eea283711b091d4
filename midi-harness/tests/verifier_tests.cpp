#include <catch2/catch.hpp>
#include "../verifier.hpp"
#include "../child_process.hpp"
#include "../readiness.hpp"
#include "test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <string>

namespace {

mh::ServiceAddress loopback(uint16_t port) {
    mh::ServiceAddress a;
    a.host = "127.0.0.1";
    a.port = port;
    return a;
}

const std::chrono::milliseconds kRequestTimeout(2000);

} // namespace

TEST_CASE("verify_endpoint rejects schemes it cannot speak", "[verifier]") {
    auto result = mh::verify_endpoint(loopback(8888), "https", mh::kPortsPath, kRequestTimeout);
    REQUIRE_FALSE(result.passed());
    REQUIRE_FALSE(result.transport_ok);
    REQUIRE(result.url == "https://127.0.0.1:8888/midi/ports");
    REQUIRE(result.error_message.find("unsupported scheme") != std::string::npos);
}

TEST_CASE("verify_endpoint reports transport failures", "[verifier][error]") {
    SECTION("Connection refused") {
        auto result = mh::verify_endpoint(loopback(pick_free_port()), "http", mh::kPortsPath, kRequestTimeout);
        REQUIRE_FALSE(result.passed());
        REQUIRE_FALSE(result.transport_ok);
        REQUIRE(result.status == 0);
        REQUIRE(result.error_message.find("connect failed") != std::string::npos);
    }

    SECTION("Service accepts but never answers") {
        // The kernel completes the handshake from the listen backlog; nobody reads.
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor silent(
            ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        uint16_t port = silent.local_endpoint().port();

        auto start = std::chrono::steady_clock::now();
        auto result = mh::verify_endpoint(loopback(port), "http", mh::kPortsPath, std::chrono::milliseconds(200));
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(result.passed());
        REQUIRE(result.error_message.find("read failed") != std::string::npos);
        REQUIRE(elapsed < std::chrono::seconds(5));
    }
}

TEST_CASE("verify_endpoint against a live service", "[verifier][integration]") {
    mh::ServiceAddress address = loopback(pick_free_port());
    mh::ChildProcess service;
    std::string error;
    REQUIRE(service.launch({MH_MOCK_SERVICE, "--status", "200",
                            "--ip", address.host, "--port", std::to_string(address.port)}, error));

    mh::AddressSentinel sentinel(address);
    mh::ScanOptions options;
    options.timeout = std::chrono::milliseconds(10000);
    REQUIRE(mh::scan_for_readiness(service.output_fd(), sentinel, options).outcome == mh::ScanOutcome::Ready);

    SECTION("GET /midi/ports passes with 200 and the body") {
        auto result = mh::verify_endpoint(address, "http", mh::kPortsPath, kRequestTimeout);
        REQUIRE(result.passed());
        REQUIRE(result.status == 200);
        REQUIRE(result.body.find("Mock MIDI Port 1") != std::string::npos);
        REQUIRE(result.error_message.empty());
        REQUIRE(result.url == "http://" + address.authority() + "/midi/ports");
    }

    SECTION("Any other status fails and is reported") {
        auto result = mh::verify_endpoint(address, "http", "/midi/nope", kRequestTimeout);
        REQUIRE_FALSE(result.passed());
        REQUIRE(result.transport_ok);
        REQUIRE(result.status == 404);
        REQUIRE(result.error_message.find("returned 404") != std::string::npos);
    }

    REQUIRE(service.terminate().ok());
}
