#ifndef MIDI_HARNESS_HPP
#define MIDI_HARNESS_HPP

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

#include "child_process.hpp"
#include "readiness.hpp"
#include "service_address.hpp"
#include "verifier.hpp"

namespace mh {

// Structure to hold parsed command-line arguments
struct Config {
    ServiceAddress address;
    std::string scheme = "http";
    std::vector<std::string> command_and_args; // empty means the default service command

    std::chrono::milliseconds ready_timeout{30000};
    std::chrono::milliseconds grace_period{10000};
    std::chrono::milliseconds kill_timeout{5000};
    std::chrono::milliseconds request_timeout{5000};
    bool echo_output = false; // copy child output to stderr while scanning

    bool show_help = false;
    bool valid = true; // Was parsing successful?
    std::string error_message; // Error message if parsing failed
};

// Parses command-line arguments.
// Returns a Config struct. If parsing fails, config.valid will be false
// and config.error_message will contain details.
Config parse_arguments(int argc, char* argv[]);

std::string usage(const std::string& program);

// How the service is started when no command is given.
std::vector<std::string> default_service_command();

// command... --ip <host> --port <port>
std::vector<std::string> build_service_argv(const Config& config);

enum class HarnessError {
    None,
    LaunchError,
    NotReady,
    ReadinessTimeout,
    Interrupted,
    VerificationFailure,
    TerminationFailure,
};

const char* to_string(HarnessError error);

// Outcome of one harness run.
struct HarnessReport {
    HarnessError error = HarnessError::None; // first stage that failed
    std::string message;
    pid_t pid = -1;

    ScanResult scan;
    bool verification_attempted = false;
    VerificationResult verification;
    bool terminated = false;
    TerminationResult termination;

    bool termination_failed() const { return terminated && !termination.ok(); }
    bool passed() const { return error == HarnessError::None && !termination_failed(); }
};

// Launch, wait for readiness, verify once, terminate. The child is always
// terminated before this returns, whichever stage failed. An exception from
// the probe or the verifier is reported as that stage's failure.
HarnessReport run_harness(const Config& config, const ReadinessProbe& probe);
HarnessReport run_harness(const Config& config);

// 0 pass, 1 failure, 2 termination failure.
int exit_code_for(const HarnessReport& report);

// SIGINT/SIGTERM handler: asks a running harness to stop and clean up.
void signal_handler(int sig);

#ifdef BUILD_MIDI_HARNESS_AS_LIB
// Test-only accessors for internal state
bool get_should_exit();
void set_should_exit(bool v);
#endif

} // namespace mh

#endif // MIDI_HARNESS_HPP
