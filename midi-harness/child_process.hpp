#ifndef CHILD_PROCESS_HPP
#define CHILD_PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

namespace mh {

/**
 * Build a NULL-terminated argv-style array suitable for exec* calls.
 * - If args is empty, returns an empty vector.
 * - If args is non-empty, returns {args[0].c_str(), ..., args[n-1].c_str(), nullptr}.
 * Note: The returned pointers are valid only as long as the original strings live.
 */
std::vector<const char*> build_exec_argv(const std::vector<std::string>& args);

struct TerminationPolicy {
    std::chrono::milliseconds grace{10000};        // after SIGINT
    std::chrono::milliseconds kill_timeout{5000};  // after SIGKILL
    std::chrono::milliseconds poll_interval{10};
};

enum class TerminationOutcome {
    Exited,   // gone before we asked
    Graceful, // exited after SIGINT
    Killed,   // needed SIGKILL
    Failed,   // could not be killed or reaped; the process may have leaked
};

const char* to_string(TerminationOutcome outcome);

struct TerminationResult {
    TerminationOutcome outcome = TerminationOutcome::Exited;
    bool have_status = false;
    int wait_status = 0; // raw status from waitpid
    std::string error_message;

    bool ok() const { return outcome != TerminationOutcome::Failed; }
    // "exited with code 0", "killed by signal 9 (Killed)", ...
    std::string describe() const;
};

// Owns one child process and the read end of its stdout pipe.
// The child runs in its own session, so signals go to its whole process group.
// Destroying a launched ChildProcess that was never terminated terminates it.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    // Starts args[0] (PATH lookup) with the rest as arguments and stdout
    // redirected to output_fd(). On failure returns false, fills
    // error_message and leaves nothing running.
    bool launch(const std::vector<std::string>& args, std::string& error_message);

    // Interrupt, wait up to policy.grace, kill, wait up to policy.kill_timeout,
    // reap. Never throws. Only the first call acts; later calls return the
    // same result.
    const TerminationResult& terminate(const TerminationPolicy& policy);
    const TerminationResult& terminate() { return terminate(policy_); }

    // Policy used by terminate() and the destructor.
    void set_termination_policy(const TerminationPolicy& policy) { policy_ = policy; }

    pid_t pid() const { return pid_; }
    int output_fd() const { return out_fd_; }
    bool launched() const { return pid_ > 0; }
    bool exited() const { return exited_; }
    bool reaped() const { return reaped_; }
    bool terminated() const { return terminated_; }

private:
    int signal_group(int sig);
    bool poll_exit();
    void reap();
    bool wait_for_exit(std::chrono::milliseconds bound);
    void drain_output(std::chrono::milliseconds wait);
    void close_output();
    void release();

    pid_t pid_ = -1;
    int out_fd_ = -1;
    bool exited_ = false; // exited; still a zombie until reaped_
    bool reaped_ = false;
    bool terminated_ = false;
    int wait_errno_ = 0;
    TerminationPolicy policy_;
    TerminationResult result_;
};

} // namespace mh

#endif // CHILD_PROCESS_HPP
