#include "digest.h"
#include "file_tree.h"
#include "permission.h"
#include "test_util.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

const std::string kAlice = "alice";
const std::string kBob = "bob";
const std::string kCarol = "carol";

Drive make_drive(const std::string &type, const std::string &ref) {
    Drive drive;
    drive.set_uuid(generate_uuid());
    drive.set_type(type);
    drive.set_owner(kAlice);
    drive.set_ref(ref);
    return drive;
}

Node *add_file(FileTree *tree, Node *parent, const std::string &name) {
    Xstat xstat;
    xstat.set_uuid(generate_uuid());
    xstat.set_type(NODE_FILE);
    xstat.set_name(name);
    xstat.mutable_magic()->set_number_value(0);
    auto [s, uuid] = tree->create_node(parent, xstat);
    assert(s.ok());
    return tree->find_node_by_uuid(uuid);
}

bool allowed(std::pair<Status, bool> result) {
    assert(result.first.ok());
    return result.second;
}

} // namespace

int main() {
    std::string dir = testing_util::scratch_dir("permission");
    FileTreeOptions options;
    options.dir = dir;
    options.probe_drives = false;
    options.hash_files = false;
    FileTree tree(options);

    Drive home = make_drive("private", "home");
    Drive shared = make_drive("public", "");
    shared.add_writelist(kBob);
    shared.add_readlist(kCarol);
    shared.set_share_allowed(true);
    Drive broken = make_drive("team", "service");
    assert(tree.create_drives({home, shared, broken}).ok());

    Node *home_file =
        add_file(&tree, tree.find_node_by_uuid(home.uuid()), "a.txt");
    Node *shared_file =
        add_file(&tree, tree.find_node_by_uuid(shared.uuid()), "b.txt");
    Node *broken_file =
        add_file(&tree, tree.find_node_by_uuid(broken.uuid()), "c.txt");

    // private: owner only
    assert(allowed(user_permitted_to_read(kAlice, home_file)));
    assert(allowed(user_permitted_to_write(kAlice, home_file)));
    assert(allowed(user_permitted_to_share(kAlice, home_file)));
    assert(!allowed(user_permitted_to_read(kBob, home_file)));
    assert(!allowed(user_permitted_to_write(kBob, home_file)));
    assert(!allowed(user_permitted_to_share(kBob, home_file)));

    // public: lists and the share flag
    assert(allowed(user_permitted_to_read(kBob, shared_file)));
    assert(allowed(user_permitted_to_read(kCarol, shared_file)));
    assert(!allowed(user_permitted_to_read(kAlice, shared_file)));
    assert(allowed(user_permitted_to_write(kBob, shared_file)));
    assert(!allowed(user_permitted_to_write(kCarol, shared_file)));
    assert(allowed(user_permitted_to_share(kCarol, shared_file)));
    assert(allowed(user_permitted_to_share(kAlice, shared_file)));

    shared.set_share_allowed(false);
    assert(tree.update_drive(shared).ok());
    assert(!allowed(user_permitted_to_share(kBob, shared_file)));

    // unknown drive type is reported, not denied
    assert(user_permitted_to_read(kAlice, broken_file).first.IsInvalidArgument());
    assert(user_permitted_to_write(kAlice, broken_file).first.IsInvalidArgument());
    assert(user_permitted_to_share(kAlice, broken_file).first.IsInvalidArgument());

    // the drive node itself carries the drive's policy
    assert(allowed(user_permitted_to_read(kAlice,
                                          tree.find_node_by_uuid(home.uuid()))));
    assert(user_permitted_to_read(kAlice, tree.root()).first.IsNodeDetached());

    assert(allowed(from_user_home(kAlice, home_file)));
    assert(!allowed(from_user_home(kBob, home_file)));
    assert(!allowed(from_user_library(kAlice, home_file)));
    assert(allowed(from_user_service(kAlice, broken_file)));
    assert(!allowed(from_user_home(kAlice, shared_file)));

    // by uuid
    assert(allowed(tree.user_permitted_to_read(kAlice, home_file->uuid())));
    assert(!allowed(tree.user_permitted_to_write(kCarol, shared_file->uuid())));
    assert(allowed(tree.user_permitted_to_share(kAlice, home_file->uuid())));
    std::string unknown = generate_uuid();
    assert(tree.user_permitted_to_read(kAlice, unknown).first.IsNodeNotFound());
    assert(tree.user_permitted_to_write(kAlice, unknown).first.IsNodeNotFound());
    assert(tree.user_permitted_to_share(kAlice, unknown).first.IsNodeNotFound());

    std::filesystem::remove_all(dir);
    std::cout << "permission tests ok\n";
    return 0;
}
