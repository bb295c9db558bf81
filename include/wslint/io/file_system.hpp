#pragma once

#include "wslint/interfaces.hpp"
#include <string>

namespace wslint {

class FileSystem : public IFileSystem {
public:
    auto open_input(const std::string& path) -> std::unique_ptr<std::istream> override;
    auto replace_atomically(const std::string& path,
                            const std::function<void(std::ostream&)>& writer) -> void override;

private:
    auto create_temp_beside(const std::string& path) -> std::string;
    auto copy_permissions(const std::string& from, const std::string& to) -> void;
};

} // namespace wslint
