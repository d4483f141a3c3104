#include "user_agent.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcphost {

namespace {

#ifdef __APPLE__
constexpr const char* kOpener = "open";
#else
constexpr const char* kOpener = "xdg-open";
#endif

} // namespace

bool SystemBrowserLauncher::launch(const std::string& url, std::string& error) {
    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Failed to fork: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // Child: keep the opener's chatter off the terminal
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execlp(kOpener, kOpener, url.c_str(), nullptr);
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid failed: ") + std::strerror(errno);
            return false;
        }
    }

    if (!WIFEXITED(status)) {
        error = std::string(kOpener) + " terminated abnormally";
        return false;
    }
    int code = WEXITSTATUS(status);
    if (code == 127) {
        error = std::string(kOpener) + " not found";
        return false;
    }
    if (code != 0) {
        error = std::string(kOpener) + " exited with status " + std::to_string(code);
        return false;
    }
    return true;
}

bool ManualLauncher::launch(const std::string&, std::string& error) {
    error = "browser launch disabled";
    return false;
}

} // namespace mcphost
