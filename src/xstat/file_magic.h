#ifndef FILE_MAGIC_H
#define FILE_MAGIC_H

#include "status.h"

#include <google/protobuf/struct.pb.h>
#include <string>
#include <utility>

// Bump when more file types are classified; records holding an older
// numeric version are re-sniffed.
constexpr int kUninterestedMagicVersion = 0;

constexpr char kJpegMagic[] = "JPEG";

// Maps a libmagic description to the stored tag: a recognised type name or
// the uninterested version number.
google::protobuf::Value parse_magic(const std::string &description);

bool magic_up_to_date(const google::protobuf::Value &magic);

// Sniffs the file content with libmagic.
std::pair<Status, google::protobuf::Value> file_magic(const std::string &path);

#endif // FILE_MAGIC_H
