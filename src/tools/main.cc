#include "drivetree.pb.h"
#include "file_tree.h"
#include "permission.h"
#include "xstat.h"

#include <butil/logging.h>
#include <fstream>
#include <gflags/gflags.h>
#include <google/protobuf/util/json_util.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

DEFINE_string(root, "", "Directory holding one sub-directory per drive");
DEFINE_string(drives, "", "JSON file of drive descriptors: {\"drives\": [...]}");
DEFINE_string(user, "", "User uuid for the check command");
DEFINE_bool(probe, true, "Probe drives right after they are created");

namespace {

const char kUsage[] =
    "usage: drivetree_tool [flags] <command>\n"
    "  xstat <path>   read (and repair) the record of a file or directory\n"
    "  peek <path>    print the record of a file if its hash is current\n"
    "  tree           load --drives under --root and print the tree\n"
    "  check <uuid>   print what --user may do with node <uuid>";

Status load_drives(const std::string &path, std::vector<Drive> *out) {
    std::ifstream in(path);
    if (!in) {
        return Status::IOError("Failed to open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    DriveList list;
    auto st = google::protobuf::util::JsonStringToMessage(buffer.str(), &list);
    if (!st.ok()) {
        return Status::InvalidArgument("Failed to parse " + path + ": " +
                                       st.ToString());
    }
    out->assign(list.drives().begin(), list.drives().end());
    return Status::OK();
}

Status print_message(const google::protobuf::Message &msg) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;
    std::string out;
    auto st = google::protobuf::util::MessageToJsonString(msg, &out, options);
    if (!st.ok()) {
        return Status::Corruption(st.ToString());
    }
    std::cout << out;
    return Status::OK();
}

Status cmd_xstat(const std::string &path) {
    auto [s, xstat] = read_xstat(path);
    if (!s.ok()) {
        return s;
    }
    return print_message(xstat);
}

Status cmd_peek(const std::string &path) {
    auto [s, attr] = peek_xattr(path);
    if (!s.ok()) {
        return s;
    }
    if (!attr) {
        std::cout << "null" << std::endl;
        return Status::OK();
    }
    return print_message(*attr);
}

Status build_tree(FileTree *tree) {
    if (FLAGS_root.empty() || FLAGS_drives.empty()) {
        return Status::InvalidArgument("--root and --drives are required");
    }
    std::vector<Drive> drives;
    Status s = load_drives(FLAGS_drives, &drives);
    if (!s.ok()) {
        return s;
    }
    s = tree->create_drives(drives);
    tree->drain();
    return s;
}

Status cmd_tree() {
    FileTreeOptions options;
    options.dir = FLAGS_root;
    options.probe_drives = FLAGS_probe;
    FileTree tree(options);

    Status s = build_tree(&tree);
    if (!s.ok()) {
        return s;
    }
    auto [s1, out] = tree.print();
    if (!s1.ok()) {
        return s1;
    }
    std::cout << out;
    LOG(INFO) << tree.node_count() << " nodes, " << tree.probe_total()
              << " probes";
    return Status::OK();
}

Status cmd_check(const std::string &uuid) {
    FileTreeOptions options;
    options.dir = FLAGS_root;
    options.probe_drives = FLAGS_probe;
    FileTree tree(options);

    Status s = build_tree(&tree);
    if (!s.ok()) {
        return s;
    }
    Node *node = tree.find_node_by_uuid(uuid);
    if (node == nullptr) {
        return Status::NodeNotFound("node " + uuid + " not found");
    }
    auto [s1, path] = node->namepath();
    if (!s1.ok()) {
        return s1;
    }
    auto [s2, read] = tree.user_permitted_to_read(FLAGS_user, uuid);
    auto [s3, write] = tree.user_permitted_to_write(FLAGS_user, uuid);
    auto [s4, share] = tree.user_permitted_to_share(FLAGS_user, uuid);
    for (const Status &st : {s2, s3, s4}) {
        if (!st.ok()) {
            return st;
        }
    }
    auto [s5, home] = from_user_home(FLAGS_user, node);
    if (!s5.ok()) {
        return s5;
    }

    std::cout << std::boolalpha << path << std::endl
              << "read: " << read << std::endl
              << "write: " << write << std::endl
              << "share: " << share << std::endl
              << "home: " << home << std::endl;
    return Status::OK();
}

} // namespace

int main(int argc, char *argv[]) {
    gflags::SetUsageMessage(kUsage);
    gflags::ParseCommandLineFlags(&argc, &argv, /*remove_flags=*/true);

    if (argc < 2) {
        std::cerr << kUsage << std::endl;
        return 2;
    }
    std::string command = argv[1];

    Status s;
    if (command == "xstat" && argc == 3) {
        s = cmd_xstat(argv[2]);
    } else if (command == "peek" && argc == 3) {
        s = cmd_peek(argv[2]);
    } else if (command == "tree" && argc == 2) {
        s = cmd_tree();
    } else if (command == "check" && argc == 3) {
        s = cmd_check(argv[2]);
    } else {
        std::cerr << kUsage << std::endl;
        return 2;
    }

    if (!s.ok()) {
        LOG(ERROR) << command << " failed: " << s.ToString();
        return 1;
    }
    return 0;
}
