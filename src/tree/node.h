#ifndef NODE_H
#define NODE_H

#include "drivetree.pb.h"
#include "status.h"

#include <cstdint>
#include <functional>
#include <google/protobuf/struct.pb.h>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

class FileTree;
class Worker;

// Order matches the alternatives of Node::Props.
enum class NodeKind { kRoot = 0, kDrive = 1, kDirectory = 2, kFile = 3 };

struct RootProps {};

struct DriveProps {
    Drive drive;
    int64_t mtime = 0;
};

struct DirectoryProps {
    int64_t mtime = 0;
};

struct FileProps {
    int64_t mtime = 0;
    uint64_t size = 0;
    google::protobuf::Value magic;
    std::string hash; // empty while no valid hash is known
};

// In-memory mirror of one entry of a drive. Children are owned by their
// parent; the parent pointer is a plain back reference.
//
// A node starts detached, is attached exactly once and, once detached
// again, is never reused.
class Node {
  public:
    using Props = std::variant<RootProps, DriveProps, DirectoryProps, FileProps>;

    static std::unique_ptr<Node> make_root(FileTree *tree);
    static std::unique_ptr<Node> make_drive(FileTree *tree, const Xstat &xstat,
                                            const Drive &drive);
    static std::unique_ptr<Node> make_directory(FileTree *tree,
                                                const Xstat &xstat);
    static std::unique_ptr<Node> make_file(FileTree *tree, const Xstat &xstat);

    ~Node();

    Node(const Node &) = delete;
    Node &operator=(const Node &) = delete;

    // Hands `node` over to `parent` and indexes it. On failure the node is
    // dropped and nothing is changed.
    static std::pair<Status, Node *> attach(std::unique_ptr<Node> node,
                                            Node *parent);

    // Unindexes the node and takes it out of its parent. Children must be
    // detached first.
    std::pair<Status, std::unique_ptr<Node>> detach();

    void pre_visit(const std::function<void(Node *)> &func);
    void post_visit(const std::function<void(Node *)> &func);
    void up_each(const std::function<void(const Node *)> &func) const;
    const Node *up_find(const std::function<bool(const Node *)> &func) const;

    // Nodes from the drive down to this one.
    std::pair<Status, std::vector<const Node *>> nodepath() const;
    std::pair<Status, const Drive *> get_drive() const;
    std::pair<Status, std::string> abspath() const;
    std::pair<Status, std::string> namepath() const;

    // Applies a fresh summary; identity and position are left alone.
    Status update(const Xstat &xstat);
    Status update_drive(const Drive &drive);

    NodeKind kind() const { return static_cast<NodeKind>(props_.index()); }
    bool is_root() const { return kind() == NodeKind::kRoot; }
    bool is_drive() const { return kind() == NodeKind::kDrive; }
    bool is_file() const { return kind() == NodeKind::kFile; }
    bool is_directory() const { return kind() == NodeKind::kDirectory; }
    bool is_container() const { return !is_file(); }
    bool is_attached() const;

    const std::string &uuid() const { return uuid_; }
    const std::string &name() const { return name_; }
    Node *parent() const { return parent_; }
    FileTree *tree() const { return tree_; }
    int64_t mtime() const;

    const FileProps *file_props() const { return std::get_if<FileProps>(&props_); }
    const DriveProps *drive_props() const {
        return std::get_if<DriveProps>(&props_);
    }

    std::vector<Node *> get_children() const;
    Node *find_child(const std::string &uuid) const;

    Worker *worker() const { return worker_.get(); }
    void set_worker(std::shared_ptr<Worker> worker);
    void clear_worker() { worker_.reset(); }
    // Best effort, returns immediately.
    void abort();

    bool probe_pending() const { return probe_pending_; }
    void set_probe_pending(bool pending) { probe_pending_ = pending; }

    // {"name": {...children...}, ...}
    google::protobuf::Value gen_object() const;

  private:
    enum class State { kInitial, kAttached, kDetached };

    Node(FileTree *tree, std::string uuid, std::string name, Props props);

    FileTree *tree_;
    State state_;
    std::string uuid_;
    std::string name_;
    Node *parent_;
    // Left null while there are no children.
    std::unique_ptr<std::vector<std::unique_ptr<Node>>> children_;
    Props props_;
    std::shared_ptr<Worker> worker_;
    bool probe_pending_;
};

#endif // NODE_H
