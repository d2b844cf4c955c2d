#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace protocol {

struct FileList {
    std::vector<std::string> files;
};

struct FileMeta {
    std::string filename;
    uint64_t size = 0;
};

struct FileEnd {
    std::string filename;
    uint64_t size = 0;
    std::string checksum; // hex BLAKE2b-256, empty if not provided
};

bool operator==(const FileList& a, const FileList& b);
bool operator==(const FileMeta& a, const FileMeta& b);
bool operator==(const FileEnd& a, const FileEnd& b);

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileList, files)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileMeta, filename, size)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileEnd, filename, size, checksum)

} // namespace protocol
