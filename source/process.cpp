#include <sdcron/process.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <stdexcept>

namespace sdcron {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static std::vector<char*> c_argv(const std::vector<std::string>& argv){
  std::vector<char*> v;
  v.reserve(argv.size()+1);
  for (auto& s : argv) v.push_back(const_cast<char*>(s.c_str()));
  v.push_back(nullptr);
  return v;
}

static void close_all(std::initializer_list<int> fds){
  for (int fd : fds) if (fd >= 0) ::close(fd);
}

CommandResult run_command(const std::vector<std::string>& argv) {
  if (argv.empty()) throw std::invalid_argument("run_command: empty argv");

  int outp[2] = {-1,-1}, errp[2] = {-1,-1}, execp[2] = {-1,-1};
  if (make_cloexec_pipe(outp) != 0 || make_cloexec_pipe(errp) != 0 ||
      make_cloexec_pipe(execp) != 0) {
    int e = errno;
    close_all({outp[0], outp[1], errp[0], errp[1], execp[0], execp[1]});
    throw std::runtime_error(fmt::format("pipe failed: {}", strerror(e)));
  }

  spdlog::debug("[exec] {}", fmt::join(argv, " "));
  auto args = c_argv(argv);

  pid_t pid = ::fork();
  if (pid < 0) {
    int e = errno;
    close_all({outp[0], outp[1], errp[0], errp[1], execp[0], execp[1]});
    throw std::runtime_error(fmt::format("fork failed: {}", strerror(e)));
  }

  if (pid == 0) {
    ::dup2(outp[1], STDOUT_FILENO);
    ::dup2(errp[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }

    ::execvp(args[0], args.data());

    int err = errno;
    (void)!::write(execp[1], &err, sizeof(err));
    _exit(127);
  }

  close_all({outp[1], errp[1], execp[1]});

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(execp[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(execp[0]);

  CommandResult r;
  pollfd fds[2] = {{outp[0], POLLIN, 0}, {errp[0], POLLIN, 0}};
  std::string* sinks[2] = {&r.out, &r.err};
  int open_fds = 2;
  char buf[4096];
  while (open_fds > 0) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t k = ::read(fds[i].fd, buf, sizeof(buf));
      if (k > 0) {
        sinks[i]->append(buf, static_cast<size_t>(k));
      } else if (k == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
  close_all({fds[0].fd, fds[1].fd});

  int st = 0;
  while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}

  if (n > 0)
    throw std::runtime_error(fmt::format("cannot run {}: {}", argv[0],
                                         strerror(child_errno)));

  r.exit_code = WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
  return r;
}

void exec_replace(const std::vector<std::string>& argv) {
  if (argv.empty()) throw std::invalid_argument("exec_replace: empty argv");
  spdlog::debug("[exec] {}", fmt::join(argv, " "));
  auto args = c_argv(argv);
  ::execvp(args[0], args.data());
  throw std::runtime_error(fmt::format("cannot run {}: {}", argv[0],
                                       strerror(errno)));
}

} // namespace sdcron
