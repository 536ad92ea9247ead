#include "pngshot/subprocess.h"

#include <cerrno>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace pngshot {
namespace {

    struct Pipe final {
        int read_fd  = -1;
        int write_fd = -1;

        ~Pipe() noexcept
        {
            close_read();
            close_write();
        }

        bool open() noexcept
        {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
            read_fd  = fds[0];
            write_fd = fds[1];
            return true;
        }

        void close_read() noexcept
        {
            if (read_fd >= 0) {
                (void)::close(read_fd);
                read_fd = -1;
            }
        }

        void close_write() noexcept
        {
            if (write_fd >= 0) {
                (void)::close(write_fd);
                write_fd = -1;
            }
        }
    };

    // Drains both pipes until EOF so neither side can fill up and stall.
    static void drain_pipes(Pipe* out_pipe, Pipe* err_pipe, std::string* out,
                            std::string* err)
    {
        char buf[4096];
        while (out_pipe->read_fd >= 0 || err_pipe->read_fd >= 0) {
            struct pollfd fds[2];
            Pipe* owners[2]       = {};
            std::string* sinks[2] = {};
            nfds_t n              = 0;
            if (out_pipe->read_fd >= 0) {
                fds[n]    = pollfd { out_pipe->read_fd, POLLIN, 0 };
                owners[n] = out_pipe;
                sinks[n]  = out;
                n += 1;
            }
            if (err_pipe->read_fd >= 0) {
                fds[n]    = pollfd { err_pipe->read_fd, POLLIN, 0 };
                owners[n] = err_pipe;
                sinks[n]  = err;
                n += 1;
            }

            if (::poll(fds, n, -1) < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return;
            }

            for (nfds_t i = 0; i < n; ++i) {
                if (fds[i].revents == 0) {
                    continue;
                }
                const ssize_t got = ::read(owners[i]->read_fd, buf,
                                           sizeof(buf));
                if (got > 0) {
                    sinks[i]->append(buf, static_cast<size_t>(got));
                } else if (got == 0 || errno != EINTR) {
                    owners[i]->close_read();
                }
            }
        }
    }

}  // namespace

const char*
process_status_name(ProcessStatus status) noexcept
{
    switch (status) {
    case ProcessStatus::Ok: return "ok";
    case ProcessStatus::NotFound: return "not_found";
    case ProcessStatus::SpawnFailed: return "spawn_failed";
    case ProcessStatus::WaitFailed: return "wait_failed";
    case ProcessStatus::Signaled: return "signaled";
    }
    return "unknown";
}


ProcessResult
run_process(const ProcessOptions& options)
{
    ProcessResult result;
    if (options.executable.empty()) {
        result.status = ProcessStatus::NotFound;
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(options.args.size() + 2U);
    argv.push_back(const_cast<char*>(options.executable.c_str()));
    for (const std::string& arg : options.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    Pipe out_pipe;
    Pipe err_pipe;
    if ((options.capture_stdout && !out_pipe.open())
        || (options.capture_stderr && !err_pipe.open())) {
        result.status       = ProcessStatus::SpawnFailed;
        result.error_number = errno;
        return result;
    }

    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        result.status = ProcessStatus::SpawnFailed;
        return result;
    }
    int rc = ::posix_spawn_file_actions_addopen(&actions, STDIN_FILENO,
                                                "/dev/null", O_RDONLY, 0);
    if (rc == 0) {
        rc = options.capture_stdout
                 ? ::posix_spawn_file_actions_adddup2(&actions,
                                                      out_pipe.write_fd,
                                                      STDOUT_FILENO)
                 : ::posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO,
                                                      "/dev/null", O_WRONLY,
                                                      0);
    }
    if (rc == 0) {
        rc = options.capture_stderr
                 ? ::posix_spawn_file_actions_adddup2(&actions,
                                                      err_pipe.write_fd,
                                                      STDERR_FILENO)
                 : ::posix_spawn_file_actions_addopen(&actions, STDERR_FILENO,
                                                      "/dev/null", O_WRONLY,
                                                      0);
    }

    pid_t pid = -1;
    if (rc == 0) {
        rc = ::posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(),
                            environ);
    }
    ::posix_spawn_file_actions_destroy(&actions);

    // The child holds its own copies; EOF arrives once it exits.
    out_pipe.close_write();
    err_pipe.close_write();

    if (rc != 0) {
        result.error_number = rc;
        result.status       = (rc == ENOENT || rc == ENOTDIR)
                                  ? ProcessStatus::NotFound
                                  : ProcessStatus::SpawnFailed;
        return result;
    }

    drain_pipes(&out_pipe, &err_pipe, &result.stdout_text,
                &result.stderr_text);

    int wstatus = 0;
    for (;;) {
        const pid_t w = ::waitpid(pid, &wstatus, 0);
        if (w == pid) {
            break;
        }
        if (w < 0 && errno != EINTR) {
            result.status       = ProcessStatus::WaitFailed;
            result.error_number = errno;
            return result;
        }
    }

    if (WIFEXITED(wstatus)) {
        result.exit_code = WEXITSTATUS(wstatus);
        result.status    = ProcessStatus::Ok;
    } else {
        result.status = ProcessStatus::Signaled;
        if (WIFSIGNALED(wstatus)) {
            result.exit_code = 128 + WTERMSIG(wstatus);
        }
    }
    return result;
}

}  // namespace pngshot
