#include "readiness.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <unistd.h>
#include <utility>

#include "midi_harness_sys.hpp"

namespace mh {

AddressSentinel::AddressSentinel(ServiceAddress address)
    : address_(std::move(address)), needle_(address_.authority()) {}

bool AddressSentinel::matches(const std::string& line) const {
    std::string::size_type pos = line.find(needle_);
    while (pos != std::string::npos) {
        bool clean_start = true;
        if (pos > 0) {
            unsigned char before = static_cast<unsigned char>(line[pos - 1]);
            clean_start = !(std::isalnum(before) || before == '.' || before == '-');
        }
        std::string::size_type end = pos + needle_.size();
        bool clean_end = end >= line.size() ||
                         !std::isdigit(static_cast<unsigned char>(line[end]));
        if (clean_start && clean_end) return true;
        pos = line.find(needle_, pos + 1);
    }
    return false;
}

std::string AddressSentinel::describe() const {
    return "a line containing " + needle_;
}

const char* to_string(ScanOutcome outcome) {
    switch (outcome) {
    case ScanOutcome::Ready: return "ready";
    case ScanOutcome::NotReady: return "not ready";
    case ScanOutcome::Timeout: return "timeout";
    case ScanOutcome::Interrupted: return "interrupted";
    case ScanOutcome::ReadError: return "read error";
    }
    return "unknown";
}

namespace {

void keep_tail(std::string& captured, std::size_t limit) {
    if (captured.size() > limit) {
        captured.erase(0, captured.size() - limit);
    }
}

bool check_line(std::string line, const ReadinessProbe& probe, const ScanOptions& options,
                ScanResult& result) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (options.echo) {
        std::cerr << "MH: child | " << line << "\n";
    }
    if (probe.matches(line)) {
        result.outcome = ScanOutcome::Ready;
        result.ready_line = std::move(line);
        return true;
    }
    return false;
}

} // namespace

ScanResult scan_for_readiness(int fd, const ReadinessProbe& probe, const ScanOptions& options) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + options.timeout;

    ScanResult result;
    std::string pending;
    char buf[4096];

    while (true) {
        if (options.cancel_flag && *options.cancel_flag) {
            result.outcome = ScanOutcome::Interrupted;
            result.error_message = "interrupted while waiting for " + probe.describe();
            return result;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            result.outcome = ScanOutcome::Timeout;
            result.error_message = "no " + probe.describe() + " within " +
                                   std::to_string(options.timeout.count()) + " ms";
            return result;
        }

        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(fd, &fds);
        struct timeval tv{};
        tv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);

        int ret = sys::select(fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret < 0) {
            if (errno == EINTR) continue;
            result.outcome = ScanOutcome::ReadError;
            result.error_message = std::string("select failed: ") + std::strerror(errno);
            return result;
        }
        if (ret == 0 || !FD_ISSET(fd, &fds)) continue;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            result.outcome = ScanOutcome::ReadError;
            result.error_message = std::string("read failed: ") + std::strerror(errno);
            return result;
        }
        if (n == 0) {
            // EOF: the child closed stdout, usually because it exited.
            if (!pending.empty() && check_line(pending, probe, options, result)) {
                return result;
            }
            result.outcome = ScanOutcome::NotReady;
            result.error_message = "output closed before " + probe.describe();
            return result;
        }

        result.captured.append(buf, static_cast<std::size_t>(n));
        keep_tail(result.captured, options.capture_limit);

        pending.append(buf, static_cast<std::size_t>(n));
        std::string::size_type nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (check_line(std::move(line), probe, options, result)) {
                return result;
            }
        }
        // A line longer than the capture window cannot be a sensible banner.
        keep_tail(pending, options.capture_limit);
    }
}

} // namespace mh
