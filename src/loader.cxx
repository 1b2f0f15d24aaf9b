/*
    Tapevm - A bounds-checked brainfuck interpreter
    Source loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "loader.hxx"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#ifdef _WIN32
#include <fstream>
#include <iterator>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {
#ifndef _WIN32
struct FileDescriptor {
    int fd = -1;
    explicit FileDescriptor(int f) : fd(f) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    ~FileDescriptor() {
        if (fd >= 0) ::close(fd);
    }
};

bool readAll(int fd, std::size_t sizeHint, std::string& out, std::string& err) {
    std::string content;
    content.reserve(sizeHint);
    char buf[1 << 16];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            content.append(buf, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            err = std::strerror(errno);
            return false;
        }
    }
    out.swap(content);
    return true;
}
#endif
}  // namespace

bool tapevm::loadSource(const std::string& path, std::string& out, std::string& err) {
#ifdef _WIN32
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        err = errno ? std::strerror(errno) : "File could not be opened";
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        err = "Error while reading file";
        return false;
    }
    out.swap(content);
    return true;
#else
    FileDescriptor file(::open(path.c_str(), O_RDONLY));
    if (file.fd < 0) {
        err = std::strerror(errno);
        return false;
    }
    struct stat st{};
    if (fstat(file.fd, &st) != 0) {
        err = std::strerror(errno);
        return false;
    }
    if (S_ISDIR(st.st_mode)) {
        err = std::strerror(EISDIR);
        return false;
    }
    // st_size is only meaningful for regular files; pipes report 0 and are read to EOF.
    const std::size_t hint = S_ISREG(st.st_mode) ? static_cast<std::size_t>(st.st_size) : 0;
    return readAll(file.fd, hint, out, err);
#endif
}
