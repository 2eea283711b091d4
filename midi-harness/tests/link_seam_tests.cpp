#include <catch2/catch.hpp>
#include "../verifier.hpp"
#include "test_support.hpp"

#include <netdb.h>
#include <atomic>

namespace {
std::atomic<int> link_seam_call_count{0};
}

// Replaces libc's resolver for this binary so name resolution always fails.
extern "C" int getaddrinfo(const char* node,
                            const char* service,
                            const struct addrinfo* hints,
                            struct addrinfo** res) {
    (void)node;
    (void)service;
    (void)hints;
    (void)res;
    ++link_seam_call_count;
    return EAI_NONAME;
}

TEST_CASE("link seam override replaces libc symbol", "[link_seam]") {
    link_seam_call_count = 0;
    int rc = ::getaddrinfo(nullptr, nullptr, nullptr, nullptr);
    REQUIRE(rc == EAI_NONAME);
    REQUIRE(link_seam_call_count.load() == 1);
}

TEST_CASE("resolver failure is a verification transport error", "[link_seam][verifier]") {
    link_seam_call_count = 0;
    mh::ServiceAddress address;
    address.host = "harmonia.invalid";
    address.port = 8888;

    auto result = mh::verify_endpoint(address, "http", mh::kPortsPath, std::chrono::milliseconds(1000));

    REQUIRE(link_seam_call_count.load() >= 1);
    REQUIRE_FALSE(result.passed());
    REQUIRE_FALSE(result.transport_ok);
    REQUIRE(result.error_message.find("resolve failed") != std::string::npos);
}

TEST_CASE("literal addresses skip name resolution", "[link_seam][verifier]") {
    link_seam_call_count = 0;
    mh::ServiceAddress address;
    address.host = "127.0.0.1";
    address.port = pick_free_port(); // nothing listens here

    auto result = mh::verify_endpoint(address, "http", mh::kPortsPath, std::chrono::milliseconds(1000));

    REQUIRE(link_seam_call_count.load() == 0);
    REQUIRE_FALSE(result.transport_ok);
    REQUIRE(result.error_message.find("connect failed") != std::string::npos);
}
