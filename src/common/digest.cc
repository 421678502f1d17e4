#include "digest.h"
#include "util.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <gflags/gflags.h>
#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

DEFINE_int32(hash_buffer_size, 1 << 20,
             "Bytes read per step when hashing file content");

namespace {

struct EVPContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

std::string openssl_error(const std::string &what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what + " failed";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return what + " failed: " + buf;
}

bool is_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

bool is_hex(char c) {
    return is_lower_hex(c) || (c >= 'A' && c <= 'F');
}

// Closes the descriptor on every return path.
class FdGuard {
  public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    int get() const { return fd_; }

  private:
    int fd_;
};

} // namespace

std::string to_hex(const unsigned char *data, size_t len) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

std::string generate_uuid() {
    unsigned char uuid[16];
    if (RAND_bytes(uuid, sizeof(uuid)) != 1) {
        throw std::runtime_error(openssl_error("RAND_bytes"));
    }
    uuid[6] = static_cast<unsigned char>((uuid[6] & 0x0F) | 0x40);
    uuid[8] = static_cast<unsigned char>((uuid[8] & 0x3F) | 0x80);

    std::string hex = to_hex(uuid, sizeof(uuid));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" +
           hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

bool is_uuid(const std::string &s) {
    if (s.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < s.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') {
                return false;
            }
        } else if (!is_hex(s[i])) {
            return false;
        }
    }
    return true;
}

bool is_sha256(const std::string &s) {
    if (s.size() != 64) {
        return false;
    }
    for (char c : s) {
        if (!is_lower_hex(c)) {
            return false;
        }
    }
    return true;
}

std::pair<Status, std::string>
sha256_file(const std::string &path, const std::atomic<bool> *aborted) {
    FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        return {Status::IOError(errno_message("open", path)), ""};
    }

    DigestCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return {Status::IOError(openssl_error("EVP_DigestInit_ex")), ""};
    }

    size_t buffer_size = FLAGS_hash_buffer_size > 0
                             ? static_cast<size_t>(FLAGS_hash_buffer_size)
                             : 4096;
    std::vector<unsigned char> buf(buffer_size);
    while (true) {
        if (aborted && aborted->load()) {
            return {Status::IOError("hashing aborted: " + path), ""};
        }
        ssize_t n = ::read(fd.get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return {Status::IOError(errno_message("read", path)), ""};
        }
        if (n == 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) !=
            1) {
            return {Status::IOError(openssl_error("EVP_DigestUpdate")), ""};
        }
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) {
        return {Status::IOError(openssl_error("EVP_DigestFinal_ex")), ""};
    }
    return {Status::OK(), to_hex(md, len)};
}
