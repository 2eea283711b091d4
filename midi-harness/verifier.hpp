#ifndef VERIFIER_HPP
#define VERIFIER_HPP

#include <chrono>
#include <string>

#include "service_address.hpp"

namespace mh {

struct VerificationResult {
    std::string url;
    bool transport_ok = false; // a complete HTTP response was read
    unsigned status = 0;
    std::string body;
    std::string error_message; // transport error, or the unexpected status

    bool passed() const { return transport_ok && status == 200; }
};

// Issues exactly one GET for path against address and reads the response.
// Every network step is bounded by timeout. Only "http" is supported.
VerificationResult verify_endpoint(const ServiceAddress& address,
                                   const std::string& scheme,
                                   const std::string& path,
                                   std::chrono::milliseconds timeout);

} // namespace mh

#endif // VERIFIER_HPP
