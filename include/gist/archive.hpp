#pragma once

#include <gist/process.hpp>
#include <gist/result.hpp>
#include <gist/types.hpp>
#include <gist/util/logger.hpp>
#include <gist/vcs.hpp>

namespace gist {

/**
 * Clone a gist into a scratch directory and package it as
 * "<dest_dir>/<id>.tar.gz" (a single top-level "<id>/" directory, without
 * git metadata). The scratch directory is always removed; an interrupted
 * run also deletes the partial archive.
 *
 * @param scratch_parent Where to clone (empty: system temp directory)
 * @return Path of the written archive
 */
Result<fs::path> create_archive(const GistId& id,
                                VcsTransport& vcs,
                                ProcessRunner& runner,
                                const fs::path& dest_dir,
                                Logger* logger = nullptr,
                                const fs::path& scratch_parent = {});

}  // namespace gist
