#include "permission.h"

#include <algorithm>
#include <string>

namespace {

const char kPrivateDrive[] = "private";
const char kPublicDrive[] = "public";

bool listed(const google::protobuf::RepeatedPtrField<std::string> &list,
            const std::string &user) {
    return std::find(list.begin(), list.end(), user) != list.end();
}

std::pair<Status, const Drive *> drive_of(const Node *node) {
    if (node == nullptr) {
        return {Status::InvalidArgument("null node"), nullptr};
    }
    return node->get_drive();
}

Status invalid_type(const Drive &drive) {
    return Status::InvalidArgument("invalid drive type '" + drive.type() +
                                   "' on drive " + drive.uuid());
}

std::pair<Status, bool> owned_with_ref(const std::string &user,
                                       const Node *node,
                                       const std::string &ref) {
    auto [s, drive] = drive_of(node);
    if (!s.ok()) {
        return {s, false};
    }
    return {Status::OK(), drive->owner() == user && drive->ref() == ref};
}

} // namespace

std::pair<Status, bool> user_permitted_to_read(const std::string &user,
                                               const Node *node) {
    auto [s, drive] = drive_of(node);
    if (!s.ok()) {
        return {s, false};
    }
    if (drive->type() == kPrivateDrive) {
        return {Status::OK(), user == drive->owner()};
    }
    if (drive->type() == kPublicDrive) {
        return {Status::OK(), listed(drive->writelist(), user) ||
                                  listed(drive->readlist(), user)};
    }
    return {invalid_type(*drive), false};
}

std::pair<Status, bool> user_permitted_to_write(const std::string &user,
                                                const Node *node) {
    auto [s, drive] = drive_of(node);
    if (!s.ok()) {
        return {s, false};
    }
    if (drive->type() == kPrivateDrive) {
        return {Status::OK(), user == drive->owner()};
    }
    if (drive->type() == kPublicDrive) {
        return {Status::OK(), listed(drive->writelist(), user)};
    }
    return {invalid_type(*drive), false};
}

std::pair<Status, bool> user_permitted_to_share(const std::string &user,
                                                const Node *node) {
    auto [s, drive] = drive_of(node);
    if (!s.ok()) {
        return {s, false};
    }
    if (drive->type() == kPrivateDrive) {
        return {Status::OK(), user == drive->owner()};
    }
    if (drive->type() == kPublicDrive) {
        return {Status::OK(), drive->share_allowed()};
    }
    return {invalid_type(*drive), false};
}

std::pair<Status, bool> from_user_home(const std::string &user,
                                       const Node *node) {
    return owned_with_ref(user, node, "home");
}

std::pair<Status, bool> from_user_library(const std::string &user,
                                          const Node *node) {
    return owned_with_ref(user, node, "library");
}

std::pair<Status, bool> from_user_service(const std::string &user,
                                          const Node *node) {
    return owned_with_ref(user, node, "service");
}
