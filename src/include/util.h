#ifndef UTIL_H
#define UTIL_H

#include "status.h"

#include <cstdint>
#include <string>
#include <vector>
#include <sys/stat.h>

std::vector<std::string> split_path(const std::string &path);

std::string join_paths(const std::string &path1, const std::string &path2);

std::string filename(const std::string &path);

// Creates path and any missing parents, like `mkdir -p`.
Status mkdir_p(const std::string &path, mode_t mode = 0755);

// Modification time in epoch milliseconds.
int64_t mtime_ms(const struct stat &st);

// "<what> failed: <path> (<strerror(errno)>)"
std::string errno_message(const std::string &what, const std::string &path);

#endif // UTIL_H
