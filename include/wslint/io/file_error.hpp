#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace wslint {

// An I/O failure tied to a file. Reported as "Error <verb> <subject>: <what()>".
class FileError : public std::runtime_error {
public:
    FileError(std::string verb, std::string subject, const std::string& message)
        : std::runtime_error(message), verb_(std::move(verb)), subject_(std::move(subject)) {}

    auto verb() const -> const std::string& { return verb_; }
    auto subject() const -> const std::string& { return subject_; }

private:
    std::string verb_;     // e.g. "opening", "renaming"
    std::string subject_;  // usually the path
};

} // namespace wslint
