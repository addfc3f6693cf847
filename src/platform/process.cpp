#include "process.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>

namespace platform {

namespace {

using Clock = std::chrono::steady_clock;

struct Pipe {
    int fds[2] = {-1, -1};
    bool open() { return pipe(fds) == 0; }
    void close_read()  { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }
    ~Pipe() { close_read(); close_write(); }
};

// Exit status of a reaped child, 128+signal for a signalled one.
int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void exec_child(const std::string& program, const std::vector<std::string>& args,
                int out_fd, int err_fd) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }
    dup2(out_fd, STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    execvp(program.c_str(), argv.data());
    _exit(127);
}

// Drains whichever pipes are readable. Closed descriptors are set to -1.
void pump(int& out_fd, int& err_fd, std::string& out, std::string& err, int wait_ms) {
    struct pollfd pfds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    if (poll(pfds, 2, wait_ms) <= 0) return;

    int* fds[2] = {&out_fd, &err_fd};
    std::string* sinks[2] = {&out, &err};
    for (int i = 0; i < 2; i++) {
        if (*fds[i] < 0 || !(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        char buf[4096];
        ssize_t n = ::read(*fds[i], buf, sizeof(buf));
        if (n > 0) {
            sinks[i]->append(buf, static_cast<size_t>(n));
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
            close(*fds[i]);
            *fds[i] = -1;
        }
    }
}

} // namespace

ProcessOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           int timeout_ms) {
    ProcessOutput result;
    Pipe out_pipe, err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) return result;

    pid_t pid = fork();
    if (pid < 0) return result;
    if (pid == 0) {
        out_pipe.close_read();
        err_pipe.close_read();
        exec_child(program, args, out_pipe.fds[1], err_pipe.fds[1]);
    }
    result.spawned = true;
    out_pipe.close_write();
    err_pipe.close_write();

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    int& out_fd = out_pipe.fds[0];
    int& err_fd = err_pipe.fds[0];
    while ((out_fd >= 0 || err_fd >= 0) && Clock::now() < deadline) {
        pump(out_fd, err_fd, result.stdout_data, result.stderr_data, 20);
    }

    int status = 0;
    while (Clock::now() < deadline) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            result.exit_code = decode_status(status);
            return result;
        }
        usleep(10 * 1000);
    }

    result.timed_out = true;
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    return result;
}

} // namespace platform
