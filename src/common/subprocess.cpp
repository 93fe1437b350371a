#include "common/subprocess.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

pid_t Subprocess::forkExec(const std::vector<std::string>& argv, int stdoutFd, int stderrFd) {
    if (argv.empty()) {
        throw ProcessError("Cannot run an empty command line");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw ProcessError("fork: " + std::string(strerror(errno)));
    }

    if (pid == 0) {
        // The parent may block termination signals for its watcher thread.
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (stdoutFd >= 0) {
            dup2(stdoutFd, STDOUT_FILENO);
        }
        if (stderrFd >= 0) {
            dup2(stderrFd, STDERR_FILENO);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    return pid;
}

int Subprocess::decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int Subprocess::run(const std::vector<std::string>& argv, const std::string& stdoutPath) {
    Logger::debug("running: " + commandLine(argv));

    int fd = -1;
    if (!stdoutPath.empty()) {
        fd = open(stdoutPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (fd == -1) {
            throw ProcessError("open: " + stdoutPath + ": " + strerror(errno));
        }
    }

    pid_t pid;
    try {
        pid = forkExec(argv, fd, -1);
    } catch (...) {
        if (fd >= 0) {
            close(fd);
        }
        throw;
    }
    if (fd >= 0) {
        close(fd);
    }

    int status = 0;
    if (!waitForExit(pid, &status)) {
        throw ProcessError("waitpid: " + argv[0] + ": " + strerror(errno));
    }
    return status;
}

int Subprocess::runQuiet(const std::vector<std::string>& argv) {
    int fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (fd == -1) {
        throw ProcessError("open: /dev/null: " + std::string(strerror(errno)));
    }

    pid_t pid;
    try {
        pid = forkExec(argv, fd, fd);
    } catch (...) {
        close(fd);
        throw;
    }
    close(fd);

    int status = 0;
    if (!waitForExit(pid, &status)) {
        throw ProcessError("waitpid: " + argv[0] + ": " + strerror(errno));
    }
    return status;
}

std::string Subprocess::capture(const std::vector<std::string>& argv, int& status) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        throw ProcessError("pipe: " + std::string(strerror(errno)));
    }

    pid_t pid;
    try {
        pid = forkExec(argv, fds[1], -1);
    } catch (...) {
        close(fds[0]);
        close(fds[1]);
        throw;
    }
    close(fds[1]);

    std::string output;
    char buffer[4096];
    for (;;) {
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    close(fds[0]);

    if (!waitForExit(pid, &status)) {
        throw ProcessError("waitpid: " + argv[0] + ": " + strerror(errno));
    }
    return output;
}

pid_t Subprocess::spawn(const std::vector<std::string>& argv) {
    Logger::debug("starting: " + commandLine(argv));
    return forkExec(argv, -1, -1);
}

bool Subprocess::terminate(pid_t pid, int signal) {
    return kill(pid, signal) == 0;
}

bool Subprocess::waitForExit(pid_t pid, int* status) {
    int raw = 0;
    pid_t r;
    do {
        r = waitpid(pid, &raw, 0);
    } while (r == -1 && errno == EINTR);

    if (r != pid) {
        return false;
    }
    if (status) {
        *status = decodeStatus(raw);
    }
    return true;
}

bool Subprocess::isRunning(pid_t pid) {
    int raw = 0;
    pid_t r = waitpid(pid, &raw, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r == -1 && errno == ECHILD) {
        // Not our child (or already reaped): fall back to a liveness probe.
        return kill(pid, 0) == 0;
    }
    return false;
}

std::string Subprocess::findProgram(const std::string& name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path = std::getenv("PATH");
    std::stringstream dirs(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

std::string Subprocess::commandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += utils::shellQuote(arg);
    }
    return line;
}
