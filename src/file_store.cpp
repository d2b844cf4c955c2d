#include "file_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "security.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace storage {

namespace {

bool has_part_suffix(const std::string& name) {
    const std::string suffix = kPartSuffix;
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ─── AtomicFile ─────────────────────────────────────────────────────────────

AtomicFile::AtomicFile(fs::path target) : target_(std::move(target)) {
    temp_ = target_;
    temp_ += "." + security::random_hex(6) + kPartSuffix;

    out_.open(temp_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        throw StoreError("Could not open file for writing: " + temp_.string());
    }
    open_ = true;
}

AtomicFile::AtomicFile(AtomicFile&& other) noexcept
    : target_(std::move(other.target_)),
      temp_(std::move(other.temp_)),
      out_(std::move(other.out_)),
      written_(other.written_),
      open_(other.open_) {
    other.open_ = false;
}

AtomicFile::~AtomicFile() {
    abort();
}

void AtomicFile::write(const uint8_t* data, size_t size) {
    if (!open_) {
        throw StoreError("write on closed file: " + target_.string());
    }
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out_) {
        throw StoreError("Failed writing to " + temp_.string());
    }
    written_ += size;
}

void AtomicFile::commit() {
    if (!open_) {
        throw StoreError("commit on closed file: " + target_.string());
    }
    out_.close();
    if (out_.fail()) {
        abort();
        throw StoreError("Failed to flush " + temp_.string());
    }

    std::error_code ec;
    fs::rename(temp_, target_, ec);
    if (ec) {
        abort();
        throw StoreError("Failed to rename temp file to " + target_.string() + ": " + ec.message());
    }
    open_ = false;
}

void AtomicFile::abort() {
    if (!open_) return;
    open_ = false;
    out_.close();
    std::error_code ec;
    fs::remove(temp_, ec); // nothing left to report to if this fails
}

// ─── ChunkReader ────────────────────────────────────────────────────────────

ChunkReader::ChunkReader(const fs::path& path) : path_(path), in_(path, std::ios::binary) {
    if (!in_.is_open()) {
        throw StoreError("Could not open file for reading: " + path.string());
    }
    std::error_code ec;
    size_ = fs::file_size(path, ec);
    if (ec) {
        throw StoreError("Could not stat " + path.string() + ": " + ec.message());
    }
}

bool ChunkReader::next(Bytes& out, size_t max_size) {
    out.resize(max_size);
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(max_size));
    std::streamsize got = in_.gcount();
    if (in_.bad()) {
        throw StoreError("Failed reading " + path_.string());
    }
    out.resize(static_cast<size_t>(got));
    return got > 0;
}

// ─── FileStore ──────────────────────────────────────────────────────────────

FileStore::FileStore(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw StoreError("Could not create data root " + root.string() + ": " + ec.message());
    }
    root_ = fs::canonical(root, ec);
    if (ec) {
        throw StoreError("Could not resolve data root " + root.string() + ": " + ec.message());
    }
}

void FileStore::validate_name(const std::string& name) {
    if (name.empty()) {
        throw InvalidName("empty file name");
    }
    if (name == "." || name == "..") {
        throw InvalidName("invalid file name: " + name);
    }
    if (name.find_first_of("/\\") != std::string::npos || name.find('\0') != std::string::npos) {
        throw InvalidName("file name must not contain path separators: " + name);
    }
    if (has_part_suffix(name)) {
        throw InvalidName("reserved file name: " + name);
    }
    // Names travel inside JSON frames, which carry UTF-8 only
    try {
        (void)nlohmann::json(name).dump();
    } catch (const nlohmann::json::type_error&) {
        throw InvalidName("file name is not valid UTF-8");
    }
}

fs::path FileStore::resolve(const std::string& name) const {
    validate_name(name);
    fs::path full = root_ / name;

    // A symlink may still point outside the root
    std::error_code ec;
    fs::path real = fs::weakly_canonical(full, ec);
    if (ec || real.parent_path() != root_) {
        throw InvalidName("path escapes data root: " + name);
    }
    return full;
}

std::vector<std::string> FileStore::list() const {
    std::vector<std::string> files;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        throw StoreError("Failed to list files: " + ec.message());
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        std::string name = entry.path().filename().string();
        if (has_part_suffix(name)) continue;
        try {
            validate_name(name);
        } catch (const InvalidName& e) {
            logging::warn("store", std::string("skipping unlistable entry: ") + e.what());
            continue;
        }
        files.push_back(std::move(name));
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::optional<FileRecord> FileStore::stat(const std::string& name) const {
    fs::path path = resolve(name);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    FileRecord record;
    record.name = name;
    record.size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    record.modified = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return record;
}

std::optional<ChunkReader> FileStore::open(const std::string& name) const {
    fs::path path = resolve(name);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    return ChunkReader(path);
}

std::optional<Bytes> FileStore::read(const std::string& name) const {
    auto reader = open(name);
    if (!reader) {
        return std::nullopt;
    }
    Bytes content;
    content.reserve(reader->size());
    Bytes buffer;
    while (reader->next(buffer, 64 * 1024)) {
        content.insert(content.end(), buffer.begin(), buffer.end());
    }
    return content;
}

AtomicFile FileStore::create(const std::string& name) const {
    return AtomicFile(resolve(name));
}

void FileStore::write(const std::string& name, const Bytes& bytes) const {
    AtomicFile file = create(name);
    file.write(bytes);
    file.commit();
}

} // namespace storage
