#include "worker.h"
#include "digest.h"
#include "file_tree.h"
#include "util.h"
#include "xstat.h"

#include <butil/logging.h>
#include <cerrno>
#include <dirent.h>
#include <exception>
#include <memory>
#include <string>
#include <utility>

Worker::Worker(FileTree *tree, std::string node_uuid, std::string path)
    : tree_(tree), node_uuid_(std::move(node_uuid)), path_(std::move(path)),
      aborted_(false), finished_(false), status_(), thread_() {}

Worker::~Worker() {
    if (thread_.joinable()) {
        // The last reference may be dropped by the worker thread itself.
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void Worker::start() {
    auto self = shared_from_this();
    thread_ = std::thread([self] { self->main(); });
}

void Worker::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void Worker::main() {
    try {
        status_ = run();
    } catch (const std::exception &e) {
        status_ = Status::IOError(std::string("worker failed: ") + e.what());
    }
    if (status_.ok() && aborted_) {
        status_ = Status::IOError("aborted: " + path_);
    }
    finished_ = true;
    tree_->post(shared_from_this());
}

Status ProbeWorker::run() {
    auto [s, self] = read_xstat(path_);
    if (!s.ok()) {
        return s;
    }
    if (self.uuid() != node_uuid_) {
        return Status::IdentityMismatch(path_ + " is no longer " + node_uuid_);
    }
    if (self.type() != NODE_DIRECTORY) {
        return Status::IdentityMismatch(path_ + " is no longer a directory");
    }
    self_ = std::move(self);

    DIR *dir = ::opendir(path_.c_str());
    if (dir == nullptr) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return Status::NotFound(errno_message("opendir", path_));
        }
        return Status::IOError(errno_message("opendir", path_));
    }

    Status result;
    struct dirent *entry;
    while ((entry = ::readdir(dir)) != nullptr) {
        if (aborted_) {
            result = Status::IOError("aborted: " + path_);
            break;
        }
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        std::string child = join_paths(path_, name);
        auto [cs, xstat] = read_xstat(child);
        if (cs.ok()) {
            entries_.push_back(std::move(xstat));
        } else if (cs.IsNotFound() || cs.IsNotRegularEntry()) {
            // vanished or a symlink, socket, fifo or device
            continue;
        } else {
            LOG(WARNING) << "skipping " << child << ": " << cs.ToString();
        }
    }
    ::closedir(dir);
    return result;
}

void ProbeWorker::finish(FileTree *tree) { tree->probe_finished(this); }

Status HashWorker::run() {
    auto [s0, t0] = read_timestamp(path_);
    if (!s0.ok()) {
        return s0;
    }

    auto [s1, hash] = sha256_file(path_, &aborted_);
    if (!s1.ok()) {
        return s1;
    }

    auto [s2, t1] = read_timestamp(path_);
    if (!s2.ok()) {
        return s2;
    }
    if (t1 != t0) {
        return Status::StaleTimestamp(path_ + " modified while hashing");
    }

    auto [s3, xstat] = update_file_hash(path_, node_uuid_, hash, t0);
    if (!s3.ok()) {
        return s3;
    }
    result_ = std::move(xstat);
    return Status::OK();
}

void HashWorker::finish(FileTree *tree) { tree->hash_finished(this); }
