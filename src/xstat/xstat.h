#ifndef XSTAT_H
#define XSTAT_H

#include "drivetree.pb.h"
#include "status.h"

#include <cstdint>
#include <google/protobuf/struct.pb.h>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <utility>

// The identity/hash record kept in one extended attribute per entry. The
// blob is a JSON object:
//
//   directory: {"uuid": "..."}
//   file:      {"uuid": "...", "magic": 0 | "JPEG",
//               "hash": "<sha256>", "htime": <mtime ms>}
//
// A hash is trusted only while htime equals the file's current mtime.

// lstat result together with the (repaired) attribute record.
struct RawXstat {
    struct stat stats;
    google::protobuf::Struct attr;
};

// Optional seeds for force_file_xattr(); empty strings mean absent.
struct FileXattrProps {
    std::string uuid;
    std::string hash;
};

// Reads, validates and repairs the record of a directory or regular file,
// writing it back if anything had to change.
std::pair<Status, Xstat> read_xstat(const std::string &target);

std::pair<Status, RawXstat> read_xstat_raw(const std::string &target);

// Returns the record only if it holds a hash valid for the current mtime.
// Never writes.
std::pair<Status, std::optional<google::protobuf::Struct>>
peek_xattr(const std::string &target);

// Commits a hash computed out of band. Fails with IdentityMismatch if the
// entry was replaced and StaleTimestamp if it was modified since `htime`.
std::pair<Status, Xstat> update_file_hash(const std::string &target,
                                          const std::string &uuid,
                                          const std::string &hash,
                                          int64_t htime);

// Moves `staged` over `target`, carrying over target's identity and
// optionally a hash of the staged content.
std::pair<Status, Xstat> update_file(const std::string &target,
                                     const std::string &staged,
                                     const std::string &hash = "");

// Overwrites the record of a freshly created drive directory.
std::pair<Status, Xstat> force_drive_xstat(const std::string &target,
                                           const std::string &drive_uuid);

// Overwrites the record of a freshly created file.
Status force_file_xattr(const std::string &target,
                        const FileXattrProps &props);

std::pair<Status, int64_t> read_timestamp(const std::string &target);

// Builds the summary for `target` out of a raw read.
Xstat to_xstat(const std::string &target, const RawXstat &raw);

#endif // XSTAT_H
