#include <gist/archive.hpp>
#include <gist/interrupt.hpp>
#include <gist/working_directory.hpp>

#include <system_error>

namespace gist {

Result<fs::path> create_archive(const GistId& id,
                                VcsTransport& vcs,
                                ProcessRunner& runner,
                                const fs::path& dest_dir,
                                Logger* logger,
                                const fs::path& scratch_parent) {
    auto valid = validate_gist_id(id);
    if (!valid.ok()) {
        return valid.error();
    }

    std::error_code ec;
    fs::path archive = fs::absolute(dest_dir, ec) / (id + ".tar.gz");
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Invalid destination: " + dest_dir.string());
    }

    InterruptGuard guard;

    auto workdir = WorkingDirectory::create(scratch_parent);
    if (!workdir.ok()) {
        return workdir.error();
    }

    auto cloned = vcs.clone(id, workdir.value().path() / id);
    if (!cloned.ok()) {
        return cloned.error();
    }

    if (guard.interrupted()) {
        return guard.error();
    }

    if (logger) logger->debug("archive: writing " + archive.string());

    auto status = runner.run({"tar", "-czf", archive.string(), "--exclude=.git",
                              "-C", workdir.value().path().string(), id});
    if (!status.ok()) {
        return status.error();
    }
    if (guard.interrupted()) {
        std::error_code ignored;
        fs::remove(archive, ignored);
        return guard.error();
    }
    if (status.value() != 0) {
        return Error(ErrorCode::IO_ERROR,
                     "tar exited with status " + std::to_string(status.value()));
    }

    return archive;
}

}  // namespace gist
