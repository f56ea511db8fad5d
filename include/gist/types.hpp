#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace gist {

namespace fs = std::filesystem;

// Identifier assigned by the hosting service. Never generated locally.
using GistId = std::string;

// Resolved editor command, possibly with arguments ("code --wait").
using EditorSpec = std::string;

// Files to submit on create, keyed by file name.
using ContentPlan = std::map<std::string, std::string>;

// Name used for content that has no file name of its own (stdin, editor).
constexpr const char* DEFAULT_FILENAME = "file1.txt";

constexpr const char* GIST_VERSION = "0.9.0";

/**
 * One entry of the gist listing.
 */
struct GistSummary {
    GistId id;
    bool is_public = false;
    std::optional<std::string> description;
};

/**
 * Result of a create or fork request.
 */
struct CreatedGist {
    GistId id;
    std::string html_url;
};

/**
 * Settings loaded once at startup and passed to every command.
 */
struct Config {
    std::optional<fs::path> source;     // Configuration file that was read
    std::string token;
    std::optional<std::string> editor;  // [gist] editor
    std::string api_url = "https://api.github.com";
    bool verbose = false;
};

}  // namespace gist
