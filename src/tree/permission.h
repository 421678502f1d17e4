#ifndef PERMISSION_H
#define PERMISSION_H

#include "node.h"
#include "status.h"

#include <string>
#include <utility>

// Access checks resolve the drive a node belongs to and apply its policy:
//
//            read                    write          share
//   private  user == owner           user == owner  user == owner
//   public   in writelist/readlist   in writelist   share_allowed
//
// Any other drive type is reported as InvalidArgument.

std::pair<Status, bool> user_permitted_to_read(const std::string &user,
                                               const Node *node);
std::pair<Status, bool> user_permitted_to_write(const std::string &user,
                                                const Node *node);
std::pair<Status, bool> user_permitted_to_share(const std::string &user,
                                                const Node *node);

std::pair<Status, bool> from_user_home(const std::string &user,
                                       const Node *node);
std::pair<Status, bool> from_user_library(const std::string &user,
                                          const Node *node);
std::pair<Status, bool> from_user_service(const std::string &user,
                                          const Node *node);

#endif // PERMISSION_H
