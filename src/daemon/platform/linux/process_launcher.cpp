#include "platform/linux/process_launcher.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

std::vector<std::string> expand_placeholders(const std::vector<std::string>& argv,
                                             const std::map<std::string, std::string>& vars) {
    std::vector<std::string> out;
    out.reserve(argv.size());
    for (auto& arg : argv) {
        std::string expanded;
        size_t i = 0;
        while (i < arg.size()) {
            if (arg[i] == '{') {
                auto close = arg.find('}', i + 1);
                if (close != std::string::npos) {
                    auto it = vars.find(arg.substr(i + 1, close - i - 1));
                    if (it != vars.end()) {
                        expanded += it->second;
                        i = close + 1;
                        continue;
                    }
                }
            }
            expanded += arg[i++];
        }
        out.push_back(std::move(expanded));
    }
    return out;
}

namespace {

// Status record written by the intermediate child: the grandchild pid on
// success, or the errno of the failed step.
struct LaunchReport {
    pid_t pid;
    int err;
};

bool write_all(int fd, const void* data, size_t len) {
    auto* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::write(fd, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::expected<pid_t, std::string> spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        return std::unexpected(std::string("empty launcher command"));
    }

    int report_pipe[2];
    if (::pipe2(report_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(report_pipe[0]);
        ::close(report_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Intermediate child: fork the real process, report, and exit so
        // the grandchild is re-parented to init.
        ::close(report_pipe[0]);
        ::setsid();

        int exec_pipe[2];
        if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
            LaunchReport r{-1, errno};
            write_all(report_pipe[1], &r, sizeof(r));
            ::_exit(1);
        }

        pid_t grandchild = ::fork();
        if (grandchild < 0) {
            LaunchReport r{-1, errno};
            write_all(report_pipe[1], &r, sizeof(r));
            ::_exit(1);
        }

        if (grandchild == 0) {
            ::close(exec_pipe[0]);
            ::close(report_pipe[1]);
            ::execvp(args[0], args.data());
            int err = errno;
            write_all(exec_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }

        // exec_pipe closes on successful exec, so EOF here means it worked.
        ::close(exec_pipe[1]);
        int exec_err = 0;
        ssize_t n;
        do {
            n = ::read(exec_pipe[0], &exec_err, sizeof(exec_err));
        } while (n < 0 && errno == EINTR);
        ::close(exec_pipe[0]);

        LaunchReport r{grandchild, n == static_cast<ssize_t>(sizeof(exec_err)) ? exec_err : 0};
        write_all(report_pipe[1], &r, sizeof(r));
        ::_exit(0);
    }

    ::close(report_pipe[1]);
    LaunchReport report{-1, 0};
    ssize_t n;
    do {
        n = ::read(report_pipe[0], &report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    ::close(report_pipe[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        break;
    }

    if (n != static_cast<ssize_t>(sizeof(report))) {
        return std::unexpected("launcher for " + argv[0] + " exited without reporting");
    }
    if (report.err != 0) {
        return std::unexpected("exec " + argv[0] + " failed: " + std::strerror(report.err));
    }
    return report.pid;
}
