#ifndef DIGEST_H
#define DIGEST_H

#include "status.h"

#include <atomic>
#include <cstddef>
#include <string>
#include <utility>

// Random (version 4) uuid in canonical 8-4-4-4-12 lowercase form.
std::string generate_uuid();

bool is_uuid(const std::string &s);

// 64 lowercase hex characters.
bool is_sha256(const std::string &s);

// Streams the file through SHA-256. If `aborted` becomes true between reads
// the digest is abandoned and an IOError returned.
std::pair<Status, std::string>
sha256_file(const std::string &path,
            const std::atomic<bool> *aborted = nullptr);

std::string to_hex(const unsigned char *data, size_t len);

#endif // DIGEST_H
