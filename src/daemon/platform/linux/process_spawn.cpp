#include "platform/linux/process_spawn.hpp"

#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

std::expected<void, std::string> run_process(const std::vector<std::string>& argv,
                                             const std::string* stdin_text) {
    if (argv.empty()) return std::unexpected("empty command");

    int pipefd[2] = {-1, -1};
    if (stdin_text && ::pipe(pipefd) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        if (stdin_text) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (stdin_text) {
            ::close(pipefd[1]);
            ::dup2(pipefd[0], STDIN_FILENO);
            ::close(pipefd[0]);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    if (stdin_text) {
        ::close(pipefd[0]);
        const std::string& text = *stdin_text;
        size_t total_written = 0;
        while (total_written < text.size()) {
            ssize_t n = ::write(pipefd[1], text.data() + total_written,
                                text.size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                ::close(pipefd[1]);
                ::waitpid(pid, nullptr, 0);
                return std::unexpected(std::string("write() failed: ") + std::strerror(errno));
            }
            total_written += static_cast<size_t>(n);
        }
        ::close(pipefd[1]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected(argv[0] + " not found");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(argv[0] + " exited with code " +
                               std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }

    return {};
}

} // namespace platform
