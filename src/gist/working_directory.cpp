#include <gist/working_directory.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace gist {

Result<WorkingDirectory> WorkingDirectory::create(const fs::path& parent,
                                                  const std::string& prefix) {
    fs::path base = parent;
    if (base.empty()) {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Cannot locate temporary directory: " + ec.message());
        }
    }

    // mkdtemp requires a mutable C string
    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot create working directory in " + base.string() +
                     ": " + std::strerror(errno));
    }

    return WorkingDirectory(fs::path(buffer.data()));
}

WorkingDirectory::~WorkingDirectory() {
    remove();
}

WorkingDirectory::WorkingDirectory(WorkingDirectory&& other) noexcept
    : path_(std::move(other.path_))
    , owned_(other.owned_) {
    other.owned_ = false;
}

WorkingDirectory& WorkingDirectory::operator=(WorkingDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        owned_ = other.owned_;
        other.owned_ = false;
    }
    return *this;
}

fs::path WorkingDirectory::release() {
    owned_ = false;
    return path_;
}

void WorkingDirectory::remove() {
    if (!owned_) return;
    owned_ = false;

    std::error_code ec;
    fs::remove_all(path_, ec);
}

}  // namespace gist
