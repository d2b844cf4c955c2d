#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace storage {

using Bytes = std::vector<uint8_t>;

constexpr const char* kPartSuffix = ".lanftp-part";

struct FileRecord {
    std::string name;
    uint64_t size = 0;
    std::filesystem::file_time_type modified;
};

// Writes to a temporary sibling of the target and renames it into place on
// commit(). Destroying an uncommitted AtomicFile removes the temporary, so
// the target is either untouched or fully replaced.
class AtomicFile {
public:
    explicit AtomicFile(std::filesystem::path target);
    ~AtomicFile();

    AtomicFile(AtomicFile&& other) noexcept;
    AtomicFile& operator=(AtomicFile&&) = delete;
    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    void write(const uint8_t* data, size_t size);
    void write(const Bytes& bytes) { write(bytes.data(), bytes.size()); }

    void commit();
    void abort();

    uint64_t bytes_written() const { return written_; }
    const std::filesystem::path& target() const { return target_; }
    const std::filesystem::path& temp_path() const { return temp_; }

private:
    std::filesystem::path target_;
    std::filesystem::path temp_;
    std::ofstream out_;
    uint64_t written_ = 0;
    bool open_ = false;
};

// Sequential reader handing out a file in bounded slices.
class ChunkReader {
public:
    explicit ChunkReader(const std::filesystem::path& path);

    // Fills `out` with up to `max_size` bytes. Returns false at end of file.
    bool next(Bytes& out, size_t max_size);

    uint64_t size() const { return size_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    uint64_t size_ = 0;
};

// The only component touching the data root. Names are plain file names;
// anything resolving elsewhere fails with InvalidName before any I/O.
class FileStore {
public:
    // Creates the root directory if it does not exist.
    explicit FileStore(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    std::vector<std::string> list() const;
    std::optional<FileRecord> stat(const std::string& name) const;
    std::optional<Bytes> read(const std::string& name) const;
    std::optional<ChunkReader> open(const std::string& name) const;

    void write(const std::string& name, const Bytes& bytes) const;
    AtomicFile create(const std::string& name) const;

    std::filesystem::path resolve(const std::string& name) const;

    // Throws InvalidName unless `name` is a single relative path component.
    static void validate_name(const std::string& name);

private:
    std::filesystem::path root_;
};

} // namespace storage
