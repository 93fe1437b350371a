#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

// Thin fork/exec wrapper used for helpers, the export daemon and the copy tool.
class Subprocess {
public:
    // Runs argv to completion. When stdoutPath is set, standard output is
    // redirected to that file (created 0600, truncated). Returns the exit
    // status, 128 + signal for a signalled child, or 127 if exec failed.
    static int run(const std::vector<std::string>& argv, const std::string& stdoutPath = "");

    // Same as run() with stdout and stderr sent to /dev/null.
    static int runQuiet(const std::vector<std::string>& argv);

    // Runs argv and collects its standard output.
    static std::string capture(const std::vector<std::string>& argv, int& status);

    // Starts argv without waiting for it.
    static pid_t spawn(const std::vector<std::string>& argv);

    static bool terminate(pid_t pid, int signal);
    static bool waitForExit(pid_t pid, int* status = nullptr);
    static bool isRunning(pid_t pid);

    // Resolves a program name against PATH. Names containing '/' are
    // returned unchanged when executable. Empty string when not found.
    static std::string findProgram(const std::string& name);

    static std::string commandLine(const std::vector<std::string>& argv);

private:
    static pid_t forkExec(const std::vector<std::string>& argv, int stdoutFd, int stderrFd);
    static int decodeStatus(int status);
};
