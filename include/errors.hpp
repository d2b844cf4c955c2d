#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

// Bytes on the wire could not be parsed into a message. Fatal to the session.
class FramingError : public std::runtime_error {
public:
    explicit FramingError(const std::string& what) : std::runtime_error(what) {}
};

// A well-formed message arrived where the protocol does not allow it.
class ProtocolViolation : public std::runtime_error {
public:
    explicit ProtocolViolation(const std::string& what) : std::runtime_error(what) {}
};

} // namespace protocol

namespace storage {

// Name resolves outside the data root or is not a plain file name.
class InvalidName : public std::runtime_error {
public:
    explicit InvalidName(const std::string& what) : std::runtime_error(what) {}
};

// Filesystem failure (open, read, write, rename).
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace storage

namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace config
