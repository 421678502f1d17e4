#ifndef FILE_TREE_H
#define FILE_TREE_H

#include "drivetree.pb.h"
#include "node.h"
#include "status.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

class Worker;
class ProbeWorker;
class HashWorker;

struct FileTreeOptions {
    std::string dir;          // holds one directory per drive, named by uuid
    bool probe_drives = true; // probe a drive as soon as it is created
    bool hash_files = true;   // fingerprint files found without a valid hash
};

// Owns the in-memory mirror of all drives and the uuid index over it.
//
// Everything except post() must be called from one thread, the owner.
// Background probes and hashes only touch the filesystem; their results
// are applied by poll() or drain().
class FileTree {
  public:
    explicit FileTree(FileTreeOptions options);
    ~FileTree();

    FileTree(const FileTree &) = delete;
    FileTree &operator=(const FileTree &) = delete;

    const std::string &dir() const { return options_.dir; }
    Node *root() const { return root_.get(); }

    // Drive lifecycle handlers. Every drive is processed; the first error
    // is returned.
    Status create_drives(const std::vector<Drive> &drives);
    Status delete_drives(const std::vector<Drive> &drives);
    Status update_drive(const Drive &drive);

    // Does not probe the parent.
    std::pair<Status, std::string> create_node(Node *parent,
                                               const Xstat &xstat);
    Status update_node(Node *node, const Xstat &xstat);
    Status delete_node(Node *node);
    Status delete_node_by_uuid(const std::string &uuid);
    Node *find_node_by_uuid(const std::string &uuid) const;
    size_t node_count() const { return uuid_map_.size(); }

    // Unknown uuids and files are ignored.
    void request_probe_by_uuid(const std::string &uuid);
    void probe(Node *node);
    void hash(Node *node);

    // Applies finished background work; poll() never blocks, drain()
    // returns once nothing is in flight.
    size_t poll();
    void drain();

    int probe_total() const { return probe_total_; }
    int probe_now() const { return probe_now_; }
    int hash_now() const { return hash_now_; }

    std::pair<Status, bool> user_permitted_to_read(const std::string &user,
                                                   const std::string &uuid) const;
    std::pair<Status, bool> user_permitted_to_write(const std::string &user,
                                                    const std::string &uuid) const;
    std::pair<Status, bool> user_permitted_to_share(const std::string &user,
                                                    const std::string &uuid) const;

    // Names of all nodes as nested JSON objects.
    std::pair<Status, std::string> print() const;

    // Index maintenance, called by Node::attach/detach.
    void node_attached(Node *node);
    void node_detaching(Node *node);

    // Called from worker threads.
    void post(std::shared_ptr<Worker> worker);

    void probe_finished(ProbeWorker *worker);
    void hash_finished(HashWorker *worker);

  private:
    Status create_drive(const Drive &drive);
    Node *find_drive(const std::string &uuid) const;
    void reconcile(Node *node, const ProbeWorker &worker);

    FileTreeOptions options_;
    std::unordered_map<std::string, Node *> uuid_map_;

    std::mutex done_mu_;
    std::condition_variable done_cv_;
    std::deque<std::shared_ptr<Worker>> done_;
    size_t in_flight_ = 0;

    int probe_total_ = 0;
    int probe_now_ = 0;
    int hash_now_ = 0;

    // Declared last so nodes, and the workers they join, go first.
    std::unique_ptr<Node> root_;
};

#endif // FILE_TREE_H
