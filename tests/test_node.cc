#include "digest.h"
#include "file_tree.h"
#include "node.h"
#include "test_util.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

Xstat make_xstat(NodeType type, const std::string &name) {
    Xstat xstat;
    xstat.set_uuid(generate_uuid());
    xstat.set_type(type);
    xstat.set_name(name);
    xstat.set_mtime(1000);
    if (type == NODE_FILE) {
        xstat.set_size(3);
        xstat.mutable_magic()->set_number_value(0);
    }
    return xstat;
}

Drive make_drive(const std::string &type) {
    Drive drive;
    drive.set_uuid(generate_uuid());
    drive.set_type(type);
    drive.set_owner(generate_uuid());
    return drive;
}

struct Fixture {
    explicit Fixture(const std::string &dir) : tree(options(dir)) {
        drive = make_drive("private");
        Status s = tree.create_drives({drive});
        assert(s.ok());
        drive_node = tree.find_node_by_uuid(drive.uuid());
        assert(drive_node != nullptr);
    }

    static FileTreeOptions options(const std::string &dir) {
        FileTreeOptions o;
        o.dir = dir;
        o.probe_drives = false;
        o.hash_files = false;
        return o;
    }

    FileTree tree;
    Drive drive;
    Node *drive_node = nullptr;
};

void test_attach_rules(const std::string &dir) {
    Fixture f(dir);
    Node *root = f.tree.root();
    assert(root->is_root());
    assert(f.drive_node->parent() == root);
    assert(f.drive_node->is_drive());
    assert(!f.drive_node->is_directory());
    assert(!f.drive_node->is_file());
    assert(f.drive_node->is_container());

    auto [s, dir_node] =
        Node::attach(Node::make_directory(&f.tree, make_xstat(NODE_DIRECTORY, "d")),
                     f.drive_node);
    assert(s.ok());
    assert(f.tree.find_node_by_uuid(dir_node->uuid()) == dir_node);

    auto [s1, file_node] =
        Node::attach(Node::make_file(&f.tree, make_xstat(NODE_FILE, "f")),
                     dir_node);
    assert(s1.ok());

    // Files have no children.
    auto [s2, n2] = Node::attach(
        Node::make_file(&f.tree, make_xstat(NODE_FILE, "g")), file_node);
    assert(s2.IsInvalidArgument());

    // Only drives hang directly off the root.
    auto [s3, n3] = Node::attach(
        Node::make_directory(&f.tree, make_xstat(NODE_DIRECTORY, "x")), root);
    assert(s3.IsInvalidArgument());
    Drive other = make_drive("public");
    auto [s4, n4] = Node::attach(
        Node::make_drive(&f.tree, make_xstat(NODE_DIRECTORY, other.uuid()),
                         other),
        dir_node);
    assert(s4.IsInvalidArgument());

    auto [s5, n5] = Node::attach(
        Node::make_file(&f.tree, make_xstat(NODE_FILE, "h")), nullptr);
    assert(s5.IsInvalidArgument());

    // Parent from another tree.
    FileTree other_tree(Fixture::options(dir));
    auto [s6, n6] = Node::attach(
        Node::make_file(&other_tree, make_xstat(NODE_FILE, "i")), dir_node);
    assert(s6.IsInvalidArgument());

    // Duplicate identity.
    Xstat dup = make_xstat(NODE_FILE, "dup");
    auto [s7, n7] = f.tree.create_node(dir_node, dup);
    assert(s7.ok());
    assert(n7 == dup.uuid());
    auto [s8, n8] = f.tree.create_node(f.drive_node, dup);
    assert(s8.IsAlreadyExists());
    assert(f.tree.find_node_by_uuid(dup.uuid())->parent() == dir_node);

    Xstat bad = make_xstat(NODE_FILE, "bad");
    bad.set_type(NODE_TYPE_UNSPECIFIED);
    auto [s9, n9] = f.tree.create_node(dir_node, bad);
    assert(s9.IsInvalidArgument());
    assert(f.tree.find_node_by_uuid(bad.uuid()) == nullptr);
}

void test_detach(const std::string &dir) {
    Fixture f(dir);
    Xstat sub = make_xstat(NODE_DIRECTORY, "sub");
    auto [s, uuid] = f.tree.create_node(f.drive_node, sub);
    assert(s.ok());
    Node *sub_node = f.tree.find_node_by_uuid(uuid);
    Xstat leaf = make_xstat(NODE_FILE, "leaf");
    assert(f.tree.create_node(sub_node, leaf).first.ok());

    // Children go first.
    auto [s1, kept] = sub_node->detach();
    assert(s1.IsInvalidArgument());
    assert(kept == nullptr);

    Node *leaf_node = f.tree.find_node_by_uuid(leaf.uuid());
    auto [s2, detached] = leaf_node->detach();
    assert(s2.ok());
    assert(detached.get() == leaf_node);
    assert(f.tree.find_node_by_uuid(leaf.uuid()) == nullptr);
    assert(sub_node->get_children().empty());
    assert(!detached->is_attached());
    assert(detached->parent() == nullptr);

    auto [s3, again] = detached->detach();
    assert(s3.IsNodeDetached());

    // A detached node is never reused.
    auto [s4, reattached] = Node::attach(std::move(detached), sub_node);
    assert(s4.IsAlreadyAttached());
    assert(f.tree.find_node_by_uuid(leaf.uuid()) == nullptr);

    auto [s5, root_detached] = f.tree.root()->detach();
    assert(s5.IsNodeDetached());
}

void test_subtree_removal(const std::string &dir) {
    Fixture f(dir);
    size_t before = f.tree.node_count();

    Xstat a = make_xstat(NODE_DIRECTORY, "a");
    Xstat b = make_xstat(NODE_DIRECTORY, "b");
    Xstat c = make_xstat(NODE_FILE, "c");
    Xstat d = make_xstat(NODE_FILE, "d");
    assert(f.tree.create_node(f.drive_node, a).first.ok());
    Node *a_node = f.tree.find_node_by_uuid(a.uuid());
    assert(f.tree.create_node(a_node, b).first.ok());
    Node *b_node = f.tree.find_node_by_uuid(b.uuid());
    assert(f.tree.create_node(b_node, c).first.ok());
    assert(f.tree.create_node(a_node, d).first.ok());
    assert(f.tree.node_count() == before + 4);

    std::vector<std::string> pre;
    a_node->pre_visit([&pre](Node *n) { pre.push_back(n->name()); });
    assert(pre.size() == 4);
    assert(pre.front() == "a");
    std::vector<std::string> post;
    a_node->post_visit([&post](Node *n) { post.push_back(n->name()); });
    assert(post.size() == 4);
    assert(post.back() == "a");

    Status s = f.tree.delete_node_by_uuid(a.uuid());
    assert(s.ok());
    assert(f.tree.node_count() == before);
    for (const Xstat *x : {&a, &b, &c, &d}) {
        assert(f.tree.find_node_by_uuid(x->uuid()) == nullptr);
    }
    assert(f.drive_node->get_children().empty());

    assert(f.tree.delete_node_by_uuid(a.uuid()).IsNodeNotFound());
    assert(f.tree.delete_node(f.tree.root()).IsInvalidArgument());
}

void test_paths(const std::string &dir) {
    Fixture f(dir);
    Xstat sub = make_xstat(NODE_DIRECTORY, "photos");
    Xstat pic = make_xstat(NODE_FILE, "cat.jpg");
    assert(f.tree.create_node(f.drive_node, sub).first.ok());
    Node *sub_node = f.tree.find_node_by_uuid(sub.uuid());
    assert(f.tree.create_node(sub_node, pic).first.ok());
    Node *pic_node = f.tree.find_node_by_uuid(pic.uuid());

    auto [s, path] = pic_node->nodepath();
    assert(s.ok());
    assert(path.size() == 3);
    assert(path[0] == f.drive_node);
    assert(path[2] == pic_node);

    auto [s1, abs] = pic_node->abspath();
    assert(s1.ok());
    assert(abs == dir + "/" + f.drive.uuid() + "/photos/cat.jpg");

    auto [s2, names] = pic_node->namepath();
    assert(s2.ok());
    assert(names == f.drive.uuid() + "/photos/cat.jpg");

    auto [s3, drive] = pic_node->get_drive();
    assert(s3.ok());
    assert(drive->uuid() == f.drive.uuid());

    std::vector<std::string> up;
    pic_node->up_each([&up](const Node *n) { up.push_back(n->name()); });
    assert(up.size() == 4);
    assert(up[1] == "photos");
    assert(pic_node->up_find([](const Node *n) { return n->is_drive(); }) ==
           f.drive_node);

    google::protobuf::Value obj = f.tree.root()->gen_object();
    const auto &drives = obj.struct_value().fields();
    assert(drives.count(f.drive.uuid()) == 1);
    const auto &photos = drives.at(f.drive.uuid()).struct_value().fields();
    assert(photos.at("photos").struct_value().fields().count("cat.jpg") == 1);

    auto [s4, printed] = f.tree.print();
    assert(s4.ok());
    assert(printed.find("cat.jpg") != std::string::npos);

    auto [s5, detached] = pic_node->detach();
    assert(s5.ok());
    assert(detached->nodepath().first.IsNodeDetached());
    assert(detached->abspath().first.IsNodeDetached());
    assert(detached->get_drive().first.IsNodeDetached());
}

void test_update(const std::string &dir) {
    Fixture f(dir);
    Xstat file = make_xstat(NODE_FILE, "a.txt");
    assert(f.tree.create_node(f.drive_node, file).first.ok());
    Node *node = f.tree.find_node_by_uuid(file.uuid());
    assert(node->file_props()->hash.empty());

    Xstat renamed = file;
    renamed.set_name("b.txt");
    renamed.set_mtime(2000);
    renamed.set_size(10);
    renamed.set_hash(std::string(64, 'a'));
    assert(f.tree.update_node(node, renamed).ok());
    assert(node->name() == "b.txt");
    assert(node->mtime() == 2000);
    assert(node->file_props()->size == 10);
    assert(node->file_props()->hash == std::string(64, 'a'));
    assert(node->uuid() == file.uuid());

    Xstat other = make_xstat(NODE_FILE, "c.txt");
    assert(node->update(other).IsIdentityMismatch());

    Xstat as_dir = file;
    as_dir.set_type(NODE_DIRECTORY);
    assert(node->update(as_dir).IsInvalidArgument());

    Drive changed = f.drive;
    changed.set_type("public");
    changed.add_writelist("someone");
    assert(f.tree.update_drive(changed).ok());
    assert(f.drive_node->drive_props()->drive.type() == "public");
    assert(f.tree.update_drive(make_drive("private")).IsNodeNotFound());
    assert(node->update_drive(changed).IsInvalidArgument());
}

} // namespace

int main() {
    std::string dir = testing_util::scratch_dir("node");

    test_attach_rules(dir);
    test_detach(dir);
    test_subtree_removal(dir);
    test_paths(dir);
    test_update(dir);

    std::filesystem::remove_all(dir);
    std::cout << "node tests ok\n";
    return 0;
}
