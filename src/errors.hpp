#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace partbuf
{

// Base for everything the arena throws on a rejected request.
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Bad constructor arguments.
class ConfigurationError : public Error
{
public:
    explicit ConfigurationError(const std::string &what) : Error(what) {}
};

// Malformed schema, name or owner count.
class ValidationError : public Error
{
public:
    explicit ValidationError(const std::string &what) : Error(what) {}
};

class DuplicateNameError : public Error
{
public:
    explicit DuplicateNameError(const std::string &name)
        : Error("partition name '" + name + "' already exists"), name_(name) {}

    const std::string &name() const noexcept { return name_; }

private:
    std::string name_;
};

// Not enough room left in the backing store.
class CapacityError : public Error
{
public:
    CapacityError(const std::string &name, std::uint64_t required, std::uint64_t available)
        : Error("not enough free space to add partition '" + name + "' (needs " +
                std::to_string(required) + " bytes, " + std::to_string(available) + " available)"),
          name_(name), required_(required), available_(available) {}

    const std::string &name() const noexcept { return name_; }
    std::uint64_t required() const noexcept { return required_; }
    std::uint64_t available() const noexcept { return available_; }

private:
    std::string name_;
    std::uint64_t required_;
    std::uint64_t available_;
};

// Null lookup key. A programmer error rather than a rejected request.
class TypeError : public std::invalid_argument
{
public:
    explicit TypeError(const std::string &what) : std::invalid_argument(what) {}
};

} // namespace partbuf
