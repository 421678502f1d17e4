#include "xstat.h"
#include "digest.h"
#include "file_magic.h"
#include "util.h"

#include <butil/logging.h>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <gflags/gflags.h>
#include <google/protobuf/util/json_util.h>
#include <string>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <vector>

DEFINE_string(xstat_attr_name, "user.fruitmix",
              "Extended attribute holding the identity/hash record");

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

// Fields once embedded in the record, now kept by the drive model.
const char *const kLegacyFields[] = {"owner", "writelist", "readlist"};

Status stat_error(const std::string &target) {
    if (errno == ENOENT || errno == ENOTDIR) {
        return Status::NotFound(errno_message("lstat", target));
    }
    return Status::IOError(errno_message("lstat", target));
}

// A missing attribute or a blob that is not a JSON object is "no record";
// only real I/O failures are reported.
std::pair<Status, std::optional<Struct>> load_attr(const std::string &target) {
    const std::string &name = FLAGS_xstat_attr_name;
    ssize_t size = ::lgetxattr(target.c_str(), name.c_str(), nullptr, 0);
    std::string blob;
    while (size > 0) {
        blob.resize(static_cast<size_t>(size));
        ssize_t got =
            ::lgetxattr(target.c_str(), name.c_str(), &blob[0], blob.size());
        if (got >= 0) {
            blob.resize(static_cast<size_t>(got));
            break;
        }
        if (errno != ERANGE) {
            size = -1;
            break;
        }
        // grew between the two calls, ask again
        size = ::lgetxattr(target.c_str(), name.c_str(), nullptr, 0);
    }
    if (size < 0) {
        if (errno == ENODATA) {
            return {Status::OK(), std::nullopt};
        }
        return {Status::IOError(errno_message("lgetxattr", target)),
                std::nullopt};
    }

    Struct attr;
    auto st = google::protobuf::util::JsonStringToMessage(blob, &attr);
    if (!st.ok()) {
        LOG(WARNING) << "discarding malformed xattr on " << target << ": "
                     << st.ToString();
        return {Status::OK(), std::nullopt};
    }
    return {Status::OK(), std::move(attr)};
}

Status store_attr(const std::string &target, const Struct &attr) {
    std::string blob;
    auto st = google::protobuf::util::MessageToJsonString(attr, &blob);
    if (!st.ok()) {
        return Status::Corruption("Failed to serialize xattr: " +
                                  st.ToString());
    }
    if (::lsetxattr(target.c_str(), FLAGS_xstat_attr_name.c_str(), blob.data(),
                    blob.size(), 0) != 0) {
        return Status::IOError(errno_message("lsetxattr", target));
    }
    return Status::OK();
}

bool has_field(const Struct &attr, const std::string &key) {
    return attr.fields().count(key) > 0;
}

std::string string_field(const Struct &attr, const std::string &key) {
    auto it = attr.fields().find(key);
    if (it == attr.fields().end() ||
        it->second.kind_case() != Value::kStringValue) {
        return "";
    }
    return it->second.string_value();
}

// Integer-valued JSON number, as written by JSON.stringify or us.
std::optional<int64_t> integer_field(const Struct &attr,
                                     const std::string &key) {
    auto it = attr.fields().find(key);
    if (it == attr.fields().end() ||
        it->second.kind_case() != Value::kNumberValue) {
        return std::nullopt;
    }
    double v = it->second.number_value();
    if (!std::isfinite(v) || std::floor(v) != v) {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

void set_string(Struct &attr, const std::string &key, const std::string &v) {
    (*attr.mutable_fields())[key].set_string_value(v);
}

void set_number(Struct &attr, const std::string &key, int64_t v) {
    (*attr.mutable_fields())[key].set_number_value(static_cast<double>(v));
}

Value magic_field(const Struct &attr) {
    auto it = attr.fields().find("magic");
    if (it == attr.fields().end()) {
        return Value();
    }
    return it->second;
}

bool hash_valid_for(const Struct &attr, const struct stat &st) {
    auto htime = integer_field(attr, "htime");
    return is_sha256(string_field(attr, "hash")) && htime &&
           *htime == mtime_ms(st);
}

} // namespace

std::pair<Status, RawXstat> read_xstat_raw(const std::string &target) {
    RawXstat raw;
    if (::lstat(target.c_str(), &raw.stats) != 0) {
        return {stat_error(target), raw};
    }
    bool is_dir = S_ISDIR(raw.stats.st_mode);
    bool is_file = S_ISREG(raw.stats.st_mode);
    if (!is_dir && !is_file) {
        return {Status::NotRegularEntry(target +
                                        " is neither a directory nor a file"),
                raw};
    }

    auto [s, loaded] = load_attr(target);
    if (!s.ok()) {
        return {s, raw};
    }

    bool dirty = false;
    if (loaded) {
        raw.attr = std::move(*loaded);

        if (!is_uuid(string_field(raw.attr, "uuid"))) {
            LOG(WARNING) << "invalid uuid in xattr of " << target
                         << ", assigning a new identity";
            set_string(raw.attr, "uuid", generate_uuid());
            dirty = true;
        }

        if (is_file) {
            if ((has_field(raw.attr, "hash") || has_field(raw.attr, "htime")) &&
                !hash_valid_for(raw.attr, raw.stats)) {
                raw.attr.mutable_fields()->erase("hash");
                raw.attr.mutable_fields()->erase("htime");
                dirty = true;
            }

            if (!magic_up_to_date(magic_field(raw.attr))) {
                auto [s1, magic] = file_magic(target);
                if (!s1.ok()) {
                    return {s1, raw};
                }
                (*raw.attr.mutable_fields())["magic"] = magic;
                dirty = true;
            }
        }

        for (const char *legacy : kLegacyFields) {
            if (has_field(raw.attr, legacy)) {
                raw.attr.mutable_fields()->erase(legacy);
                dirty = true;
            }
        }
    } else {
        set_string(raw.attr, "uuid", generate_uuid());
        if (is_file) {
            auto [s1, magic] = file_magic(target);
            if (!s1.ok()) {
                return {s1, raw};
            }
            (*raw.attr.mutable_fields())["magic"] = magic;
        }
        dirty = true;
    }

    if (dirty) {
        Status s2 = store_attr(target, raw.attr);
        if (!s2.ok()) {
            return {s2, raw};
        }
    }
    return {Status::OK(), std::move(raw)};
}

Xstat to_xstat(const std::string &target, const RawXstat &raw) {
    Xstat xstat;
    xstat.set_uuid(string_field(raw.attr, "uuid"));
    xstat.set_name(filename(target));
    xstat.set_mtime(mtime_ms(raw.stats));
    if (S_ISDIR(raw.stats.st_mode)) {
        xstat.set_type(NODE_DIRECTORY);
    } else {
        xstat.set_type(NODE_FILE);
        xstat.set_size(static_cast<uint64_t>(raw.stats.st_size));
        *xstat.mutable_magic() = magic_field(raw.attr);
        std::string hash = string_field(raw.attr, "hash");
        if (!hash.empty()) {
            xstat.set_hash(hash);
        }
    }
    return xstat;
}

std::pair<Status, Xstat> read_xstat(const std::string &target) {
    auto [s, raw] = read_xstat_raw(target);
    if (!s.ok()) {
        return {s, Xstat()};
    }
    return {Status::OK(), to_xstat(target, raw)};
}

std::pair<Status, std::optional<Struct>>
peek_xattr(const std::string &target) {
    struct stat st;
    if (::lstat(target.c_str(), &st) != 0) {
        return {stat_error(target), std::nullopt};
    }
    if (!S_ISREG(st.st_mode)) {
        return {Status::NotRegularFile(target + " is not a regular file"),
                std::nullopt};
    }

    auto [s, attr] = load_attr(target);
    if (!s.ok()) {
        return {s, std::nullopt};
    }
    if (attr && hash_valid_for(*attr, st)) {
        return {Status::OK(), std::move(attr)};
    }
    return {Status::OK(), std::nullopt};
}

std::pair<Status, Xstat> update_file_hash(const std::string &target,
                                          const std::string &uuid,
                                          const std::string &hash,
                                          int64_t htime) {
    if (!is_sha256(hash) || htime < 0) {
        return {Status::InvalidArgument("malformed hash or htime"), Xstat()};
    }

    auto [s, raw] = read_xstat_raw(target);
    if (!s.ok()) {
        return {s, Xstat()};
    }
    if (!S_ISREG(raw.stats.st_mode)) {
        return {Status::NotRegularFile(target + " is not a regular file"),
                Xstat()};
    }
    if (string_field(raw.attr, "uuid") != uuid) {
        return {Status::IdentityMismatch(target + " has been replaced"),
                Xstat()};
    }
    if (mtime_ms(raw.stats) != htime) {
        return {Status::StaleTimestamp(target + " modified since " +
                                       std::to_string(htime)),
                Xstat()};
    }

    RawXstat updated;
    updated.stats = raw.stats;
    set_string(updated.attr, "uuid", uuid);
    set_string(updated.attr, "hash", hash);
    set_number(updated.attr, "htime", htime);
    (*updated.attr.mutable_fields())["magic"] = magic_field(raw.attr);

    Status s1 = store_attr(target, updated.attr);
    if (!s1.ok()) {
        return {s1, Xstat()};
    }
    return {Status::OK(), to_xstat(target, updated)};
}

std::pair<Status, Xstat> update_file(const std::string &target,
                                     const std::string &staged,
                                     const std::string &hash) {
    if (!hash.empty() && !is_sha256(hash)) {
        return {Status::InvalidArgument("malformed hash"), Xstat()};
    }

    auto [s, raw] = read_xstat_raw(target);
    if (!s.ok()) {
        return {s, Xstat()};
    }
    if (!S_ISREG(raw.stats.st_mode)) {
        return {Status::NotRegularFile(target + " is not a regular file"),
                Xstat()};
    }

    struct stat staged_st;
    if (::lstat(staged.c_str(), &staged_st) != 0) {
        return {stat_error(staged), Xstat()};
    }
    if (!S_ISREG(staged_st.st_mode)) {
        return {Status::NotRegularFile(staged + " is not a regular file"),
                Xstat()};
    }

    Struct attr;
    set_string(attr, "uuid", string_field(raw.attr, "uuid"));
    if (!hash.empty()) {
        set_string(attr, "hash", hash);
        set_number(attr, "htime", mtime_ms(staged_st));
    }

    Status s1 = store_attr(staged, attr);
    if (!s1.ok()) {
        return {s1, Xstat()};
    }
    if (std::rename(staged.c_str(), target.c_str()) != 0) {
        return {Status::IOError(errno_message("rename", staged)), Xstat()};
    }
    return read_xstat(target);
}

std::pair<Status, Xstat> force_drive_xstat(const std::string &target,
                                           const std::string &drive_uuid) {
    if (!is_uuid(drive_uuid)) {
        return {Status::InvalidArgument("invalid drive uuid: " + drive_uuid),
                Xstat()};
    }

    Struct attr;
    set_string(attr, "uuid", drive_uuid);
    Status s = store_attr(target, attr);
    if (!s.ok()) {
        return {s, Xstat()};
    }
    return read_xstat(target);
}

Status force_file_xattr(const std::string &target,
                        const FileXattrProps &props) {
    struct stat st;
    if (::lstat(target.c_str(), &st) != 0) {
        return stat_error(target);
    }
    if (!S_ISREG(st.st_mode)) {
        return Status::NotRegularFile(target + " is not a regular file");
    }
    if (!props.uuid.empty() && !is_uuid(props.uuid)) {
        return Status::InvalidArgument("invalid uuid: " + props.uuid);
    }
    if (!props.hash.empty() && !is_sha256(props.hash)) {
        return Status::InvalidArgument("malformed hash");
    }

    auto [s, magic] = file_magic(target);
    if (!s.ok()) {
        return s;
    }

    Struct attr;
    set_string(attr, "uuid", props.uuid.empty() ? generate_uuid() : props.uuid);
    (*attr.mutable_fields())["magic"] = magic;
    if (!props.hash.empty()) {
        set_string(attr, "hash", props.hash);
        set_number(attr, "htime", mtime_ms(st));
    }
    return store_attr(target, attr);
}

std::pair<Status, int64_t> read_timestamp(const std::string &target) {
    struct stat st;
    if (::lstat(target.c_str(), &st) != 0) {
        return {stat_error(target), 0};
    }
    return {Status::OK(), mtime_ms(st)};
}
