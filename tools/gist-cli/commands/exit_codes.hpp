#pragma once

namespace gist::cli {

// Every failure exits with the same status; the message on stderr says why.
// Named with GIST_ prefix to avoid conflict with system macros
constexpr int GIST_EXIT_SUCCESS = 0;
constexpr int GIST_EXIT_FAILURE = 1;

}  // namespace gist::cli
