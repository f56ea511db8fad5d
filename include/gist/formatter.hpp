#pragma once

#include <gist/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gist {

/**
 * Truncate text to width columns, replacing the tail with "...".
 *
 * - width == nullopt (output is not a terminal): unchanged
 * - width < 3: unchanged, there is no room for the marker
 * - text longer than width: text[0, width-3) + "..."
 */
std::string elide(const std::string& text, std::optional<std::size_t> width);

/**
 * Whether standard input is an interactive terminal.
 */
bool stdin_is_tty();

/**
 * Column count of the terminal attached to stdout, or nullopt when stdout
 * is redirected or the size cannot be queried.
 */
std::optional<std::size_t> terminal_width();

/**
 * "<id> <+|-> <description>", '+' for public gists.
 */
std::string format_summary(const GistSummary& summary);

/**
 * Full listing, one elided line per gist.
 */
std::string format_list(const std::vector<GistSummary>& gists,
                        std::optional<std::size_t> width);

/**
 * One file name per line.
 */
std::string format_files(const std::vector<std::string>& names);

/**
 * Each file as "<name>:", its content, and a blank line.
 */
std::string format_content(const std::map<std::string, std::string>& files);

}  // namespace gist
