#include "util.h"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <vector>

std::vector<std::string> split_path(const std::string &path) {
    std::vector<std::string> result;
    if (path.empty() || path == "/") {
        return result; // Return an empty vector for root or empty path
    }

    std::istringstream iss(path);
    std::string token;
    while (std::getline(iss, token, '/')) {
        if (!token.empty()) {
            result.push_back(token);
        }
    }

    return result;
}

std::string join_paths(const std::string &path1, const std::string &path2) {
    if (path1.empty()) {
        return path2;
    }
    if (path2.empty()) {
        return path1;
    }
    if (path1 == "/") {
        return "/" + path2;
    }
    if (path1.back() == '/') {
        return path1 + path2;
    }
    return path1 + "/" + path2;
}

std::string filename(const std::string &path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    size_t pos = trimmed.find_last_of('/');
    if (pos == std::string::npos) {
        return trimmed; // No separator found: return the whole path
    }
    return trimmed.substr(pos + 1);
}

Status mkdir_p(const std::string &path, mode_t mode) {
    std::string current = (!path.empty() && path.front() == '/') ? "/" : "";
    for (const auto &part : split_path(path)) {
        current = join_paths(current, part);
        if (::mkdir(current.c_str(), mode) == 0) {
            continue;
        }
        if (errno != EEXIST) {
            return Status::IOError(errno_message("mkdir", current));
        }
        struct stat st;
        if (::stat(current.c_str(), &st) != 0) {
            return Status::IOError(errno_message("stat", current));
        }
        if (!S_ISDIR(st.st_mode)) {
            return Status::IOError("mkdir failed: " + current +
                                   " exists and is not a directory");
        }
    }
    return Status::OK();
}

int64_t mtime_ms(const struct stat &st) {
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
           static_cast<int64_t>(st.st_mtim.tv_nsec) / 1000000;
}

std::string errno_message(const std::string &what, const std::string &path) {
    return what + " failed: " + path + " (" + std::strerror(errno) + ")";
}
