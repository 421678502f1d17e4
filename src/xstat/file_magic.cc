#include "file_magic.h"

#include <butil/logging.h>
#include <cmath>
#include <magic.h>
#include <string>

namespace {

// libmagic cookies are not thread safe; workers each get their own.
class MagicCookie {
  public:
    MagicCookie() : cookie_(magic_open(MAGIC_NONE)) {
        if (cookie_ == nullptr) {
            return;
        }
        if (magic_load(cookie_, nullptr) != 0) {
            const char *err = magic_error(cookie_);
            LOG(ERROR) << "magic_load failed: " << (err ? err : "unknown");
            magic_close(cookie_);
            cookie_ = nullptr;
        }
    }
    ~MagicCookie() {
        if (cookie_ != nullptr) {
            magic_close(cookie_);
        }
    }
    MagicCookie(const MagicCookie &) = delete;
    MagicCookie &operator=(const MagicCookie &) = delete;

    magic_t get() const { return cookie_; }

  private:
    magic_t cookie_;
};

} // namespace

google::protobuf::Value parse_magic(const std::string &description) {
    google::protobuf::Value magic;
    if (description.rfind("JPEG image data", 0) == 0) {
        magic.set_string_value(kJpegMagic);
    } else {
        magic.set_number_value(kUninterestedMagicVersion);
    }
    return magic;
}

bool magic_up_to_date(const google::protobuf::Value &magic) {
    switch (magic.kind_case()) {
    case google::protobuf::Value::kNumberValue: {
        double v = magic.number_value();
        return std::isfinite(v) && std::floor(v) == v &&
               v >= kUninterestedMagicVersion;
    }
    case google::protobuf::Value::kStringValue:
        return magic.string_value() == kJpegMagic;
    default:
        return false;
    }
}

std::pair<Status, google::protobuf::Value>
file_magic(const std::string &path) {
    thread_local MagicCookie cookie;
    if (cookie.get() == nullptr) {
        return {Status::IOError("libmagic unavailable"),
                google::protobuf::Value()};
    }
    const char *description = magic_file(cookie.get(), path.c_str());
    if (description == nullptr) {
        const char *err = magic_error(cookie.get());
        return {Status::IOError("magic_file failed: " + path + " (" +
                                (err ? err : "unknown") + ")"),
                google::protobuf::Value()};
    }
    return {Status::OK(), parse_magic(description)};
}
