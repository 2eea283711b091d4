#include "midi-harness.hpp"

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <sstream>

#include "outflow.hpp"

#ifndef MIDI_HARNESS_BUILD_GIT_SHA
#define MIDI_HARNESS_BUILD_GIT_SHA "unknown"
#endif

#ifndef MIDI_HARNESS_BUILD_GIT_DIRTY
#define MIDI_HARNESS_BUILD_GIT_DIRTY 0
#endif

namespace mh {

static volatile sig_atomic_t should_exit = 0;

// Handle Ctrl+C, SIGTERM: the scanner notices and the child gets terminated.
void signal_handler(int sig) {
  (void)sig;
  should_exit = 1;
}

std::string usage(const std::string& program) {
  return "Usage: " + program + " [flags] [--] [command...]\n"
    "  [command]              Service to launch; receives --ip HOST --port PORT\n"
    "                         (defaults to: cargo run --bin harmonia --)\n"
    "  --ip HOST              Address host (default 127.0.0.1)\n"
    "  --port PORT            Address port (default 8888)\n"
    "  --scheme SCHEME        URL scheme for verification (only http)\n"
    "  --ready-timeout MS     Max wait for the readiness line (default 30000)\n"
    "  --grace MS             Wait after SIGINT before SIGKILL (default 10000)\n"
    "  --kill-timeout MS      Wait after SIGKILL for reaping (default 5000)\n"
    "  --request-timeout MS   Bound for the verification request (default 5000)\n"
    "  --echo                 Copy service output to stderr while waiting\n"
    "  --help                 Show this message\n";
}

// Upper bound for every millisecond flag: one day.
static const unsigned long long kMaxDurationMs = 24ULL * 60 * 60 * 1000;

static bool parse_unsigned(const std::string& s, unsigned long long& out) {
  if (s.empty() || s[0] == '-' || s[0] == '+') return false;
  try {
    std::size_t used = 0;
    out = std::stoull(s, &used);
    return used == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

Config parse_arguments(int argc, char* argv[]) {
  Config config;

  bool in_command_args = false;

  auto fail = [&config](const std::string& message) {
    config.valid = false;
    config.error_message = message;
  };

  auto is_value_flag = [](const std::string& name) {
    return name == "--ip" || name == "--port" || name == "--scheme" ||
           name == "--ready-timeout" || name == "--grace" ||
           name == "--kill-timeout" || name == "--request-timeout";
  };

  auto apply_value = [&](const std::string& name, const std::string& val) -> bool {
    if (name == "--ip") {
      if (val.empty()) {
        fail("Host cannot be empty.\n");
        return false;
      }
      config.address.host = val;
      return true;
    }
    if (name == "--scheme") {
      if (val != "http") {
        fail("Unsupported scheme: " + val + " (only http)\n");
        return false;
      }
      config.scheme = val;
      return true;
    }
    unsigned long long n = 0;
    if (!parse_unsigned(val, n)) {
      fail("Invalid value for " + name + ": " + val + "\n");
      return false;
    }
    if (name == "--port") {
      if (n == 0 || n > 65535) {
        fail("Invalid value for --port: " + val + " (1-65535)\n");
        return false;
      }
      config.address.port = static_cast<uint16_t>(n);
      return true;
    }
    // A zero grace period means "kill right away"; the other bounds must be positive.
    if (n == 0 && name != "--grace") {
      fail("Invalid value for " + name + ": " + val + " (must be > 0)\n");
      return false;
    }
    if (n > kMaxDurationMs) {
      fail("Value for " + name + " out of range: " + val + " (max " +
           std::to_string(kMaxDurationMs) + " ms)\n");
      return false;
    }
    std::chrono::milliseconds ms(static_cast<std::chrono::milliseconds::rep>(n));
    if (name == "--ready-timeout") {
      config.ready_timeout = ms;
    } else if (name == "--grace") {
      config.grace_period = ms;
    } else if (name == "--kill-timeout") {
      config.kill_timeout = ms;
    } else {
      config.request_timeout = ms;
    }
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!in_command_args && !arg.empty() && arg[0] == '-') {
      if (arg == "--") {
        in_command_args = true;
        continue;
      }
      if (arg == "--echo") {
        config.echo_output = true;
        continue;
      }
      if (arg == "--help" || arg == "-h") {
        config.show_help = true;
        continue;
      }
      // --flag=value or --flag value
      std::string::size_type eq = arg.find('=');
      std::string name = arg.substr(0, eq);
      if (is_value_flag(name)) {
        std::string val;
        if (eq != std::string::npos) {
          val = arg.substr(eq + 1);
        } else {
          if (i + 1 >= argc) {
            fail("Missing value for " + name + "\n");
            return config;
          }
          val = argv[++i];
        }
        if (!apply_value(name, val)) {
          return config;
        }
        continue;
      }
      // Unknown flag
      fail("Unknown flag: " + arg + "\n");
      return config;
    }

    in_command_args = true;
    config.command_and_args.push_back(arg);
  }

  return config;
}

std::vector<std::string> default_service_command() {
  return {"cargo", "run", "--bin", "harmonia", "--"};
}

std::vector<std::string> build_service_argv(const Config& config) {
  std::vector<std::string> args = config.command_and_args.empty()
                                      ? default_service_command()
                                      : config.command_and_args;
  args.push_back("--ip");
  args.push_back(config.address.host);
  args.push_back("--port");
  args.push_back(std::to_string(config.address.port));
  return args;
}

const char* to_string(HarnessError error) {
  switch (error) {
  case HarnessError::None: return "ok";
  case HarnessError::LaunchError: return "LaunchError";
  case HarnessError::NotReady: return "NotReady";
  case HarnessError::ReadinessTimeout: return "ReadinessTimeout";
  case HarnessError::Interrupted: return "Interrupted";
  case HarnessError::VerificationFailure: return "VerificationFailure";
  case HarnessError::TerminationFailure: return "TerminationFailure";
  }
  return "unknown";
}

static std::string join(const std::vector<std::string>& args) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i) oss << ' ';
    oss << args[i];
  }
  return oss.str();
}

HarnessReport run_harness(const Config& config, const ReadinessProbe& probe) {
  HarnessReport report;

  TerminationPolicy policy;
  policy.grace = config.grace_period;
  policy.kill_timeout = config.kill_timeout;

  const std::vector<std::string> args = build_service_argv(config);
  ChildProcess child;
  child.set_termination_policy(policy);

  std::string launch_error;
  if (!child.launch(args, launch_error)) {
    report.error = HarnessError::LaunchError;
    report.message = launch_error;
    return report;
  }
  report.pid = child.pid();
  std::cerr << "MH: started service (PID " << child.pid() << "): " << join(args) << "\n";

  // A stage that throws must not leave the service running; the child is
  // terminated below like on any other failure.
  try {
    ScanOptions scan_options;
    scan_options.timeout = config.ready_timeout;
    scan_options.echo = config.echo_output;
    scan_options.cancel_flag = &should_exit;
    report.scan = scan_for_readiness(child.output_fd(), probe, scan_options);

    switch (report.scan.outcome) {
    case ScanOutcome::Ready:
      std::cerr << "MH: service ready: " << report.scan.ready_line << "\n";
      report.verification_attempted = true;
      report.verification = verify_endpoint(config.address, config.scheme, kPortsPath,
                                            config.request_timeout);
      if (!report.verification.passed()) {
        report.error = HarnessError::VerificationFailure;
        report.message = report.verification.error_message;
      }
      break;
    case ScanOutcome::NotReady:
    case ScanOutcome::ReadError:
      report.error = HarnessError::NotReady;
      report.message = report.scan.error_message;
      break;
    case ScanOutcome::Timeout:
      report.error = HarnessError::ReadinessTimeout;
      report.message = report.scan.error_message;
      break;
    case ScanOutcome::Interrupted:
      report.error = HarnessError::Interrupted;
      report.message = report.scan.error_message;
      break;
    }
  } catch (const std::exception& e) {
    report.error = report.verification_attempted ? HarnessError::VerificationFailure
                                                 : HarnessError::NotReady;
    report.message = std::string(report.verification_attempted ? "verification" : "readiness scan") +
                     " failed: " + e.what();
    std::cerr << "MH: error: " << report.message << "\n";
  }

  report.termination = child.terminate(policy);
  report.terminated = true;
  std::cerr << "MH: service PID " << report.pid << " stopped ("
            << to_string(report.termination.outcome) << ", "
            << report.termination.describe() << ")\n";

  if (!report.termination.ok()) {
    if (report.error == HarnessError::None) {
      report.error = HarnessError::TerminationFailure;
      report.message = report.termination.error_message;
    } else {
      report.message += "; termination failed: " + report.termination.error_message;
    }
  }
  return report;
}

HarnessReport run_harness(const Config& config) {
  AddressSentinel sentinel(config.address);
  return run_harness(config, sentinel);
}

int exit_code_for(const HarnessReport& report) {
  if (report.termination_failed()) return 2;
  return report.error == HarnessError::None ? 0 : 1;
}

#ifdef BUILD_MIDI_HARNESS_AS_LIB
bool get_should_exit() { return should_exit != 0; }
void set_should_exit(bool v) { should_exit = v ? 1 : 0; }
#endif

} // namespace mh

#ifndef BUILD_MIDI_HARNESS_AS_LIB
int main(int argc, char* argv[]) {
  mh::Config config = mh::parse_arguments(argc, argv);
  if (config.show_help) {
    std::cout << mh::usage(argv[0]);
    return 0;
  }
  if (!config.valid) {
    std::cerr << "MIDI Harness - launches a service, waits until it is ready and verifies "
              << mh::kPortsPath << "\n\n"
              << config.error_message << mh::usage(argv[0]);
    return 1;
  }

  // Handle signals
  signal(SIGINT, mh::signal_handler);
  signal(SIGTERM, mh::signal_handler);

  std::cerr << "MH: midi-harness build " << MIDI_HARNESS_BUILD_GIT_SHA
            << (MIDI_HARNESS_BUILD_GIT_DIRTY ? "-dirty" : "") << ", target "
            << config.address.url(config.scheme, mh::kPortsPath) << "\n";

  mh::HarnessReport report;
  try {
    report = mh::run_harness(config);
  } catch (const std::exception& e) {
    std::cerr << "MH: error: " << e.what() << "\n";
    return 1;
  }

  if (report.passed()) {
    std::cout << "PASS " << report.verification.url << " -> " << report.verification.status << "\n"
              << report.verification.body << "\n";
  } else {
    std::cerr << "FAIL [" << mh::to_string(report.error) << "] " << report.message << "\n";
    bool readiness_failed = report.error == mh::HarnessError::NotReady ||
                            report.error == mh::HarnessError::ReadinessTimeout;
    if (readiness_failed && !report.scan.captured.empty()) {
      std::cerr << "MH: last output from the service:\n"
                << mh::render_tail(report.scan.captured, 20);
    }
  }
  return mh::exit_code_for(report);
}
#endif // BUILD_MIDI_HARNESS_AS_LIB
