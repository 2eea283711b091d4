#ifndef READINESS_HPP
#define READINESS_HPP

#include <chrono>
#include <csignal>
#include <cstddef>
#include <string>

#include "service_address.hpp"

namespace mh {

// Decides whether a line of service output announces readiness.
class ReadinessProbe {
public:
    virtual ~ReadinessProbe() = default;
    virtual bool matches(const std::string& line) const = 0;
    virtual std::string describe() const = 0;
};

// Matches lines naming the service's own authority ("127.0.0.1:8888").
// A generic "Listening" line, or one naming another port, never matches.
class AddressSentinel : public ReadinessProbe {
public:
    explicit AddressSentinel(ServiceAddress address);

    bool matches(const std::string& line) const override;
    std::string describe() const override;

    const ServiceAddress& address() const { return address_; }

private:
    ServiceAddress address_;
    std::string needle_;
};

enum class ScanOutcome {
    Ready,
    NotReady,    // stream closed before the sentinel appeared
    Timeout,
    Interrupted,
    ReadError,
};

const char* to_string(ScanOutcome outcome);

struct ScanOptions {
    std::chrono::milliseconds timeout{30000};
    bool echo = false; // copy each line to stderr
    std::size_t capture_limit = 64 * 1024;
    // Checked between reads; a non-zero value stops the scan.
    const volatile sig_atomic_t* cancel_flag = nullptr;
};

struct ScanResult {
    ScanOutcome outcome = ScanOutcome::NotReady;
    std::string ready_line;
    std::string captured; // most recent output, bounded by capture_limit
    std::string error_message;
};

// Reads fd line by line until probe matches, the stream closes, the timeout
// expires or the cancel flag is raised. Does not close fd.
ScanResult scan_for_readiness(int fd, const ReadinessProbe& probe, const ScanOptions& options);

} // namespace mh

#endif // READINESS_HPP
