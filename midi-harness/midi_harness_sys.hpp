#ifndef MIDI_HARNESS_SYS_HPP
#define MIDI_HARNESS_SYS_HPP

#include <sys/select.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>

// Replaceable entry points for the syscalls the harness needs to fail on demand
// in tests. Production code always goes through these wrappers.
namespace mh {
namespace sys {
using select_fn = int (*)(int, fd_set*, fd_set*, fd_set*, struct timeval*);
using kill_fn = int (*)(pid_t, int);
using waitpid_fn = pid_t (*)(pid_t, int*, int);
using waitid_fn = int (*)(idtype_t, id_t, siginfo_t*, int);

extern select_fn select_impl;
extern kill_fn kill_impl;
extern waitpid_fn waitpid_impl;
extern waitid_fn waitid_impl;

int select(int nfds, fd_set* readfds, fd_set* writefds, fd_set* exceptfds, struct timeval* timeout);
int kill(pid_t pid, int sig);
pid_t waitpid(pid_t pid, int* status, int options);
int waitid(idtype_t idtype, id_t id, siginfo_t* info, int options);

void reset_to_default_select();
void reset_to_defaults();
} // namespace sys
} // namespace mh

#endif // MIDI_HARNESS_SYS_HPP
