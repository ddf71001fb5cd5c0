#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

std::string read_secret(const std::string& prompt) {
    std::cout << prompt << std::flush;

    struct termios old_t;
    bool is_tty = tcgetattr(STDIN_FILENO, &old_t) == 0;
    if (is_tty) {
        struct termios new_t = old_t;
        new_t.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &new_t);
    }

    std::string value;
    std::getline(std::cin, value);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_t);
        std::cout << "\n";
    }
    return value;
}

Result<void> write_private_file(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return Result<void>::Err("Cannot write " + tmp.string() + ": " + std::strerror(errno));
    }
    // A stale sibling keeps its old mode through O_CREAT
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        std::string err = std::strerror(errno);
        ::close(fd);
        ::unlink(tmp.c_str());
        return Result<void>::Err("Cannot restrict " + tmp.string() + ": " + err);
    }

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            std::string err = std::strerror(errno);
            ::close(fd);
            ::unlink(tmp.c_str());
            return Result<void>::Err("Cannot write " + tmp.string() + ": " + err);
        }
        written += static_cast<size_t>(n);
    }

    int rc = ::fsync(fd);
    int sync_errno = errno;
    if (::close(fd) != 0 && rc == 0) {
        rc = -1;
        sync_errno = errno;
    }
    if (rc != 0) {
        std::string err = std::strerror(sync_errno);
        ::unlink(tmp.c_str());
        return Result<void>::Err("Cannot write " + tmp.string() + ": " + err);
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        ::unlink(tmp.c_str());
        return Result<void>::Err("Cannot replace " + path.string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}

} // namespace platform
