#pragma once

#include <gist/result.hpp>
#include <gist/types.hpp>

#include <string>

namespace gist {

/**
 * Scratch directory owned by one edit, archive or interactive create.
 *
 * Created with mkdtemp; removed recursively when the object goes out of
 * scope, whatever the exit path. release() hands the directory over to the
 * caller instead (used when local changes must survive a failed push).
 *
 * Non-copyable; movable.
 */
class WorkingDirectory {
public:
    /**
     * Create a fresh directory "<parent>/<prefix>XXXXXX".
     * @param parent Defaults to the system temp directory when empty
     */
    static Result<WorkingDirectory> create(const fs::path& parent = {},
                                           const std::string& prefix = "gist-");

    ~WorkingDirectory();

    WorkingDirectory(const WorkingDirectory&) = delete;
    WorkingDirectory& operator=(const WorkingDirectory&) = delete;

    WorkingDirectory(WorkingDirectory&& other) noexcept;
    WorkingDirectory& operator=(WorkingDirectory&& other) noexcept;

    const fs::path& path() const { return path_; }

    /**
     * Stop owning the directory; it will not be removed.
     * @return The directory path
     */
    fs::path release();

    bool owns() const { return owned_; }

private:
    explicit WorkingDirectory(fs::path path) : path_(std::move(path)), owned_(true) {}

    void remove();

    fs::path path_;
    bool owned_ = false;
};

}  // namespace gist
