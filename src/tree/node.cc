#include "node.h"
#include "file_tree.h"
#include "util.h"
#include "worker.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

Node::Node(FileTree *tree, std::string uuid, std::string name, Props props)
    : tree_(tree), state_(State::kInitial), uuid_(std::move(uuid)),
      name_(std::move(name)), parent_(nullptr), children_(),
      props_(std::move(props)), worker_(), probe_pending_(false) {}

Node::~Node() {
    if (worker_) {
        worker_->abort();
        worker_->join();
    }
}

std::unique_ptr<Node> Node::make_root(FileTree *tree) {
    std::unique_ptr<Node> root(new Node(tree, "", "", RootProps()));
    // The root is never attached to anything; it is the anchor itself.
    root->state_ = State::kAttached;
    return root;
}

std::unique_ptr<Node> Node::make_drive(FileTree *tree, const Xstat &xstat,
                                       const Drive &drive) {
    DriveProps props;
    props.drive = drive;
    props.mtime = xstat.mtime();
    return std::unique_ptr<Node>(
        new Node(tree, xstat.uuid(), xstat.name(), std::move(props)));
}

std::unique_ptr<Node> Node::make_directory(FileTree *tree,
                                           const Xstat &xstat) {
    DirectoryProps props;
    props.mtime = xstat.mtime();
    return std::unique_ptr<Node>(
        new Node(tree, xstat.uuid(), xstat.name(), props));
}

std::unique_ptr<Node> Node::make_file(FileTree *tree, const Xstat &xstat) {
    FileProps props;
    props.mtime = xstat.mtime();
    props.size = xstat.size();
    props.magic = xstat.magic();
    props.hash = xstat.has_hash() ? xstat.hash() : "";
    return std::unique_ptr<Node>(
        new Node(tree, xstat.uuid(), xstat.name(), std::move(props)));
}

bool Node::is_attached() const { return state_ == State::kAttached; }

std::pair<Status, Node *> Node::attach(std::unique_ptr<Node> node,
                                       Node *parent) {
    if (!node) {
        return {Status::InvalidArgument("null node"), nullptr};
    }
    if (node->state_ != State::kInitial) {
        return {Status::AlreadyAttached("node " + node->uuid_ +
                                        " has already been attached"),
                nullptr};
    }
    if (parent == nullptr || !parent->is_container()) {
        return {Status::InvalidArgument("parent is not a directory node"),
                nullptr};
    }
    if (parent->tree_ != node->tree_) {
        return {Status::InvalidArgument("parent belongs to another tree"),
                nullptr};
    }
    if (!parent->is_attached()) {
        return {Status::NodeDetached("parent " + parent->uuid_ +
                                     " is detached"),
                nullptr};
    }
    if (node->is_drive() != parent->is_root()) {
        return {Status::InvalidArgument(
                    "drives and only drives attach to the root"),
                nullptr};
    }
    if (node->tree_->find_node_by_uuid(node->uuid_) != nullptr) {
        return {Status::AlreadyExists("uuid " + node->uuid_ +
                                      " is already in the tree"),
                nullptr};
    }

    Node *raw = node.get();
    if (!parent->children_) {
        parent->children_ =
            std::make_unique<std::vector<std::unique_ptr<Node>>>();
    }
    parent->children_->push_back(std::move(node));
    raw->parent_ = parent;
    raw->state_ = State::kAttached;
    raw->tree_->node_attached(raw);
    return {Status::OK(), raw};
}

std::pair<Status, std::unique_ptr<Node>> Node::detach() {
    if (state_ != State::kAttached || parent_ == nullptr) {
        return {Status::NodeDetached("node " + uuid_ + " is not attached"),
                nullptr};
    }
    if (children_) {
        return {Status::InvalidArgument("node " + uuid_ +
                                        " still has attached children"),
                nullptr};
    }

    auto &siblings = *parent_->children_;
    auto it = std::find_if(siblings.begin(), siblings.end(),
                           [this](const std::unique_ptr<Node> &c) {
                               return c.get() == this;
                           });
    if (it == siblings.end()) {
        return {Status::Corruption("node " + uuid_ +
                                   " missing from its parent"),
                nullptr};
    }

    tree_->node_detaching(this);
    std::unique_ptr<Node> self = std::move(*it);
    siblings.erase(it);
    if (siblings.empty()) {
        parent_->children_.reset();
    }
    parent_ = nullptr;
    state_ = State::kDetached;
    return {Status::OK(), std::move(self)};
}

void Node::pre_visit(const std::function<void(Node *)> &func) {
    func(this);
    for (Node *child : get_children()) {
        child->pre_visit(func);
    }
}

void Node::post_visit(const std::function<void(Node *)> &func) {
    for (Node *child : get_children()) {
        child->post_visit(func);
    }
    func(this);
}

void Node::up_each(const std::function<void(const Node *)> &func) const {
    for (const Node *n = this; n != nullptr; n = n->parent_) {
        func(n);
    }
}

const Node *
Node::up_find(const std::function<bool(const Node *)> &func) const {
    for (const Node *n = this; n != nullptr; n = n->parent_) {
        if (func(n)) {
            return n;
        }
    }
    return nullptr;
}

std::pair<Status, std::vector<const Node *>> Node::nodepath() const {
    std::vector<const Node *> path;
    for (const Node *n = this; n != nullptr; n = n->parent_) {
        if (n->is_root()) {
            std::reverse(path.begin(), path.end());
            return {Status::OK(), std::move(path)};
        }
        path.push_back(n);
    }
    return {Status::NodeDetached("node " + uuid_ + " is detached"), {}};
}

std::pair<Status, const Drive *> Node::get_drive() const {
    const Node *drive = up_find([](const Node *n) {
        return n->parent_ != nullptr && n->parent_->is_root();
    });
    if (drive == nullptr || drive->drive_props() == nullptr) {
        return {Status::NodeDetached("node " + uuid_ + " is detached"),
                nullptr};
    }
    return {Status::OK(), &drive->drive_props()->drive};
}

std::pair<Status, std::string> Node::abspath() const {
    auto [s, path] = nodepath();
    if (!s.ok()) {
        return {s, ""};
    }
    std::string result = tree_->dir();
    for (const Node *n : path) {
        result = join_paths(result, n->name_);
    }
    return {Status::OK(), result};
}

std::pair<Status, std::string> Node::namepath() const {
    auto [s, path] = nodepath();
    if (!s.ok()) {
        return {s, ""};
    }
    std::string result;
    for (const Node *n : path) {
        result = join_paths(result, n->name_);
    }
    return {Status::OK(), result};
}

Status Node::update(const Xstat &xstat) {
    if (xstat.uuid() != uuid_) {
        return Status::IdentityMismatch("xstat " + xstat.uuid() +
                                        " does not describe node " + uuid_);
    }

    switch (kind()) {
    case NodeKind::kRoot:
        return Status::InvalidArgument("root has no xstat");
    case NodeKind::kDrive:
    case NodeKind::kDirectory:
        if (xstat.type() != NODE_DIRECTORY) {
            return Status::InvalidArgument("node " + uuid_ +
                                           " is not a file");
        }
        break;
    case NodeKind::kFile:
        if (xstat.type() != NODE_FILE) {
            return Status::InvalidArgument("node " + uuid_ +
                                           " is not a directory");
        }
        break;
    }

    name_ = xstat.name();
    if (auto *drive = std::get_if<DriveProps>(&props_)) {
        drive->mtime = xstat.mtime();
    } else if (auto *dir = std::get_if<DirectoryProps>(&props_)) {
        dir->mtime = xstat.mtime();
    } else if (auto *file = std::get_if<FileProps>(&props_)) {
        file->mtime = xstat.mtime();
        file->size = xstat.size();
        file->magic = xstat.magic();
        file->hash = xstat.has_hash() ? xstat.hash() : "";
    }
    return Status::OK();
}

Status Node::update_drive(const Drive &drive) {
    auto *props = std::get_if<DriveProps>(&props_);
    if (props == nullptr) {
        return Status::InvalidArgument("node " + uuid_ + " is not a drive");
    }
    props->drive = drive;
    return Status::OK();
}

int64_t Node::mtime() const {
    switch (kind()) {
    case NodeKind::kDrive:
        return std::get<DriveProps>(props_).mtime;
    case NodeKind::kDirectory:
        return std::get<DirectoryProps>(props_).mtime;
    case NodeKind::kFile:
        return std::get<FileProps>(props_).mtime;
    default:
        return 0;
    }
}

std::vector<Node *> Node::get_children() const {
    std::vector<Node *> result;
    if (children_) {
        result.reserve(children_->size());
        for (const auto &child : *children_) {
            result.push_back(child.get());
        }
    }
    return result;
}

Node *Node::find_child(const std::string &uuid) const {
    if (!children_) {
        return nullptr;
    }
    for (const auto &child : *children_) {
        if (child->uuid_ == uuid) {
            return child.get();
        }
    }
    return nullptr;
}

void Node::set_worker(std::shared_ptr<Worker> worker) {
    if (worker_) {
        worker_->abort();
    }
    worker_ = std::move(worker);
}

void Node::abort() {
    if (worker_) {
        worker_->abort();
    }
}

google::protobuf::Value Node::gen_object() const {
    google::protobuf::Value value;
    auto *fields = value.mutable_struct_value()->mutable_fields();
    for (Node *child : get_children()) {
        (*fields)[child->name_] = child->gen_object();
    }
    return value;
}
