#ifndef SERVICE_ADDRESS_HPP
#define SERVICE_ADDRESS_HPP

#include <cstdint>
#include <string>

namespace mh {

// The one endpoint the harness verifies against.
constexpr const char* kPortsPath = "/midi/ports";

// Address the service is launched with. The same value feeds the launch
// arguments, the readiness sentinel and the verification URL.
struct ServiceAddress {
    std::string host = "127.0.0.1";
    uint16_t port = 8888;

    // "host:port", with IPv6 literals bracketed ("[::1]:8888").
    std::string authority() const {
        std::string h = host;
        if (h.find(':') != std::string::npos && h.front() != '[') {
            h = "[" + h + "]";
        }
        return h + ":" + std::to_string(port);
    }

    std::string url(const std::string& scheme, const std::string& path) const {
        return scheme + "://" + authority() + path;
    }
};

inline bool operator==(const ServiceAddress& a, const ServiceAddress& b) {
    return a.host == b.host && a.port == b.port;
}

inline bool operator!=(const ServiceAddress& a, const ServiceAddress& b) {
    return !(a == b);
}

} // namespace mh

#endif // SERVICE_ADDRESS_HPP
