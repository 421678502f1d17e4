#include "file_tree.h"
#include "digest.h"
#include "permission.h"
#include "util.h"
#include "worker.h"
#include "xstat.h"

#include <butil/logging.h>
#include <google/protobuf/util/json_util.h>
#include <sys/stat.h>
#include <unordered_map>
#include <unordered_set>

FileTree::FileTree(FileTreeOptions options)
    : options_(std::move(options)), root_(Node::make_root(this)) {}

FileTree::~FileTree() {
    // Joins every running worker before the queue goes away.
    root_.reset();
}

Node *FileTree::find_drive(const std::string &uuid) const {
    return root_->find_child(uuid);
}

Status FileTree::create_drive(const Drive &drive) {
    if (!is_uuid(drive.uuid())) {
        return Status::InvalidArgument("invalid drive uuid: " + drive.uuid());
    }
    if (find_node_by_uuid(drive.uuid()) != nullptr) {
        return Status::AlreadyExists("drive " + drive.uuid() +
                                     " already exists");
    }

    std::string target = join_paths(options_.dir, drive.uuid());
    Status s = mkdir_p(target);
    if (!s.ok()) {
        return s;
    }
    auto [s1, xstat] = force_drive_xstat(target, drive.uuid());
    if (!s1.ok()) {
        return s1;
    }
    auto [s2, node] =
        Node::attach(Node::make_drive(this, xstat, drive), root_.get());
    if (!s2.ok()) {
        return s2;
    }

    LOG(INFO) << "drive " << drive.uuid() << " created";
    if (options_.probe_drives) {
        probe(node);
    }
    return Status::OK();
}

Status FileTree::create_drives(const std::vector<Drive> &drives) {
    Status result;
    for (const Drive &drive : drives) {
        Status s = create_drive(drive);
        if (!s.ok()) {
            LOG(WARNING) << "Failed to create drive " << drive.uuid() << ": "
                         << s.ToString();
            if (result.ok()) {
                result = s;
            }
        }
    }
    return result;
}

Status FileTree::delete_drives(const std::vector<Drive> &drives) {
    std::unordered_set<std::string> uuids;
    for (const Drive &drive : drives) {
        uuids.insert(drive.uuid());
    }

    Status result;
    for (Node *node : root_->get_children()) {
        if (uuids.count(node->uuid()) == 0) {
            continue;
        }
        std::string uuid = node->uuid();
        Status s = delete_node(node);
        if (s.ok()) {
            LOG(INFO) << "drive " << uuid << " deleted";
        } else {
            LOG(WARNING) << "Failed to delete drive " << uuid << ": "
                         << s.ToString();
            if (result.ok()) {
                result = s;
            }
        }
    }
    return result;
}

Status FileTree::update_drive(const Drive &drive) {
    Node *node = find_drive(drive.uuid());
    if (node == nullptr) {
        return Status::NodeNotFound("drive " + drive.uuid() + " not found");
    }
    return node->update_drive(drive);
}

std::pair<Status, std::string> FileTree::create_node(Node *parent,
                                                     const Xstat &xstat) {
    std::unique_ptr<Node> node;
    switch (xstat.type()) {
    case NODE_DIRECTORY:
        node = Node::make_directory(this, xstat);
        break;
    case NODE_FILE:
        node = Node::make_file(this, xstat);
        break;
    default:
        return {Status::InvalidArgument("bad xstat type for " + xstat.name()),
                ""};
    }

    auto [s, attached] = Node::attach(std::move(node), parent);
    if (!s.ok()) {
        return {s, ""};
    }
    return {Status::OK(), attached->uuid()};
}

Status FileTree::update_node(Node *node, const Xstat &xstat) {
    if (node == nullptr) {
        return Status::InvalidArgument("null node");
    }
    return node->update(xstat);
}

Status FileTree::delete_node(Node *node) {
    if (node == nullptr || node->is_root()) {
        return Status::InvalidArgument("cannot delete root");
    }
    if (!node->is_attached()) {
        return Status::NodeDetached("node " + node->uuid() + " is detached");
    }

    std::vector<Node *> order;
    node->post_visit([&order](Node *n) { order.push_back(n); });
    for (Node *n : order) {
        // Drops the node as soon as it leaves the tree.
        auto [s, detached] = n->detach();
        if (!s.ok()) {
            return s;
        }
    }
    return Status::OK();
}

Status FileTree::delete_node_by_uuid(const std::string &uuid) {
    Node *node = find_node_by_uuid(uuid);
    if (node == nullptr) {
        return Status::NodeNotFound("node " + uuid + " not found");
    }
    return delete_node(node);
}

Node *FileTree::find_node_by_uuid(const std::string &uuid) const {
    auto it = uuid_map_.find(uuid);
    if (it == uuid_map_.end()) {
        return nullptr;
    }
    return it->second;
}

void FileTree::node_attached(Node *node) { uuid_map_[node->uuid()] = node; }

void FileTree::node_detaching(Node *node) {
    node->abort();
    uuid_map_.erase(node->uuid());
}

void FileTree::request_probe_by_uuid(const std::string &uuid) {
    Node *node = find_node_by_uuid(uuid);
    if (node == nullptr || node->is_file()) {
        return;
    }
    probe(node);
}

void FileTree::probe(Node *node) {
    if (node == nullptr || !node->is_container() || node->is_root()) {
        return;
    }
    if (node->worker() != nullptr) {
        // Folded into a single re-probe once the running one is applied.
        node->set_probe_pending(true);
        return;
    }

    auto [s, path] = node->abspath();
    if (!s.ok()) {
        LOG(WARNING) << "Cannot probe node " << node->uuid() << ": "
                     << s.ToString();
        return;
    }

    auto worker = std::make_shared<ProbeWorker>(this, node->uuid(), path);
    node->set_worker(worker);
    ++in_flight_;
    ++probe_total_;
    ++probe_now_;
    LOG(INFO) << "node " << node->uuid() << " " << node->name()
              << " probe started";
    worker->start();
}

void FileTree::hash(Node *node) {
    if (node == nullptr || !node->is_file() || node->worker() != nullptr) {
        return;
    }

    auto [s, path] = node->abspath();
    if (!s.ok()) {
        LOG(WARNING) << "Cannot hash node " << node->uuid() << ": "
                     << s.ToString();
        return;
    }

    auto worker = std::make_shared<HashWorker>(this, node->uuid(), path);
    node->set_worker(worker);
    ++in_flight_;
    ++hash_now_;
    LOG(INFO) << "node " << node->uuid() << " " << node->name()
              << " hash started";
    worker->start();
}

void FileTree::post(std::shared_ptr<Worker> worker) {
    {
        std::lock_guard<std::mutex> lk(done_mu_);
        done_.push_back(std::move(worker));
    }
    done_cv_.notify_one();
}

size_t FileTree::poll() {
    std::deque<std::shared_ptr<Worker>> done;
    {
        std::lock_guard<std::mutex> lk(done_mu_);
        done.swap(done_);
    }
    for (auto &worker : done) {
        worker->join();
        --in_flight_;
        worker->finish(this);
    }
    return done.size();
}

void FileTree::drain() {
    while (in_flight_ > 0) {
        {
            std::unique_lock<std::mutex> lk(done_mu_);
            done_cv_.wait(lk, [this] { return !done_.empty(); });
        }
        poll();
    }
}

void FileTree::probe_finished(ProbeWorker *worker) {
    --probe_now_;

    Node *node = find_node_by_uuid(worker->node_uuid());
    if (node == nullptr || node->worker() != worker) {
        // The node went away or was re-probed meanwhile.
        return;
    }
    LOG(INFO) << "node " << node->uuid() << " " << node->name()
              << " probe stopped";
    node->clear_worker();
    bool again = node->probe_pending();
    node->set_probe_pending(false);

    if (!worker->status().ok()) {
        LOG(WARNING) << "probe " << worker->path()
                     << " failed: " << worker->status().ToString();
        // Let the parent listing decide what became of it.
        if (!node->is_drive()) {
            probe(node->parent());
        }
        return;
    }

    reconcile(node, *worker);
    if (again) {
        probe(node);
    }
}

void FileTree::reconcile(Node *node, const ProbeWorker &worker) {
    Status s = node->update(worker.self());
    if (!s.ok()) {
        LOG(WARNING) << "Failed to update " << worker.path() << ": "
                     << s.ToString();
    }

    std::unordered_map<std::string, const Xstat *> found;
    for (const Xstat &xstat : worker.entries()) {
        found[xstat.uuid()] = &xstat;
    }

    for (Node *child : node->get_children()) {
        auto it = found.find(child->uuid());
        bool is_file_entry =
            it != found.end() && it->second->type() == NODE_FILE;
        if (it == found.end() || child->is_file() != is_file_entry) {
            std::string uuid = child->uuid();
            Status ds = delete_node(child);
            if (!ds.ok()) {
                LOG(WARNING) << "Failed to delete node " << uuid << ": "
                             << ds.ToString();
            }
            continue;
        }

        const Xstat &xstat = *it->second;
        found.erase(it);
        int64_t mtime = child->mtime();
        Status us = child->update(xstat);
        if (!us.ok()) {
            LOG(WARNING) << "Failed to update node " << child->uuid() << ": "
                         << us.ToString();
            continue;
        }
        if (child->is_directory() && xstat.mtime() != mtime) {
            probe(child);
        } else if (child->is_file() && !xstat.has_hash() &&
                   options_.hash_files) {
            hash(child);
        }
    }

    for (const Xstat &xstat : worker.entries()) {
        if (found.count(xstat.uuid()) == 0) {
            continue;
        }

        Node *existing = find_node_by_uuid(xstat.uuid());
        if (existing != nullptr) {
            // Same identity seen elsewhere: either the entry was moved here
            // or it is a copy that kept its xattr.
            bool ancestor = node->up_find([existing](const Node *n) {
                                return n == existing;
                            }) != nullptr;
            auto [ps, old_path] = existing->abspath();
            struct stat st;
            if (ancestor ||
                (ps.ok() && ::lstat(old_path.c_str(), &st) == 0)) {
                LOG(WARNING) << "duplicate uuid " << xstat.uuid() << " at "
                             << join_paths(worker.path(), xstat.name())
                             << ", skipped";
                continue;
            }
            Status ds = delete_node(existing);
            if (!ds.ok()) {
                LOG(WARNING) << "Failed to delete node " << xstat.uuid()
                             << ": " << ds.ToString();
                continue;
            }
        }

        auto [cs, uuid] = create_node(node, xstat);
        if (!cs.ok()) {
            LOG(WARNING) << "Failed to create node for "
                         << join_paths(worker.path(), xstat.name()) << ": "
                         << cs.ToString();
            continue;
        }
        Node *child = find_node_by_uuid(uuid);
        if (child->is_directory()) {
            probe(child);
        } else if (!xstat.has_hash() && options_.hash_files) {
            hash(child);
        }
    }
}

void FileTree::hash_finished(HashWorker *worker) {
    --hash_now_;

    Node *node = find_node_by_uuid(worker->node_uuid());
    if (node == nullptr || node->worker() != worker) {
        return;
    }
    LOG(INFO) << "node " << node->uuid() << " " << node->name()
              << " hash stopped";
    node->clear_worker();

    if (!worker->status().ok()) {
        LOG(WARNING) << "hash " << worker->path()
                     << " failed: " << worker->status().ToString();
        if (worker->status().IsStaleTimestamp() ||
            worker->status().IsIdentityMismatch() ||
            worker->status().IsNotFound()) {
            probe(node->parent());
        }
        return;
    }

    Status s = update_node(node, worker->result());
    if (!s.ok()) {
        LOG(WARNING) << "Failed to update node " << node->uuid() << ": "
                     << s.ToString();
    }
}

std::pair<Status, bool>
FileTree::user_permitted_to_read(const std::string &user,
                                 const std::string &uuid) const {
    const Node *node = find_node_by_uuid(uuid);
    if (node == nullptr) {
        return {Status::NodeNotFound("node " + uuid + " not found"), false};
    }
    return ::user_permitted_to_read(user, node);
}

std::pair<Status, bool>
FileTree::user_permitted_to_write(const std::string &user,
                                  const std::string &uuid) const {
    const Node *node = find_node_by_uuid(uuid);
    if (node == nullptr) {
        return {Status::NodeNotFound("node " + uuid + " not found"), false};
    }
    return ::user_permitted_to_write(user, node);
}

std::pair<Status, bool>
FileTree::user_permitted_to_share(const std::string &user,
                                  const std::string &uuid) const {
    const Node *node = find_node_by_uuid(uuid);
    if (node == nullptr) {
        return {Status::NodeNotFound("node " + uuid + " not found"), false};
    }
    return ::user_permitted_to_share(user, node);
}

std::pair<Status, std::string> FileTree::print() const {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    std::string out;
    auto st = google::protobuf::util::MessageToJsonString(root_->gen_object(),
                                                          &out, options);
    if (!st.ok()) {
        return {Status::Corruption("Failed to print tree: " + st.ToString()),
                ""};
    }
    return {Status::OK(), out};
}
