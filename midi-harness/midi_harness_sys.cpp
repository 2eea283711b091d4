#include "midi_harness_sys.hpp"

#include <csignal>
#include <sys/wait.h>

namespace mh {
namespace sys {
select_fn select_impl = ::select;
kill_fn kill_impl = ::kill;
waitpid_fn waitpid_impl = ::waitpid;
waitid_fn waitid_impl = ::waitid;

int select(int nfds, fd_set* readfds, fd_set* writefds, fd_set* exceptfds, struct timeval* timeout) {
  return select_impl(nfds, readfds, writefds, exceptfds, timeout);
}

int kill(pid_t pid, int sig) {
  return kill_impl(pid, sig);
}

pid_t waitpid(pid_t pid, int* status, int options) {
  return waitpid_impl(pid, status, options);
}

int waitid(idtype_t idtype, id_t id, siginfo_t* info, int options) {
  return waitid_impl(idtype, id, info, options);
}

void reset_to_default_select() {
  select_impl = ::select;
}

void reset_to_defaults() {
  reset_to_default_select();
  kill_impl = ::kill;
  waitpid_impl = ::waitpid;
  waitid_impl = ::waitid;
}
} // namespace sys
} // namespace mh
