#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

std::expected<void, std::string> daemonize() {
    pid_t pid = ::fork();
    if (pid < 0) return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    if (pid > 0) ::_exit(0);

    if (::setsid() < 0) ::_exit(1);

    pid = ::fork();
    if (pid < 0) ::_exit(1);
    if (pid > 0) ::_exit(0);

    // The socket and history database are per-user.
    ::umask(077);
    if (::chdir("/") < 0) ::_exit(1);

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) ::_exit(1);
    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(null_fd, STDERR_FILENO);
    if (null_fd > STDERR_FILENO) ::close(null_fd);
    return {};
}

} // namespace platform
