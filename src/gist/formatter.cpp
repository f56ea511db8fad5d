#include <gist/formatter.hpp>

#include <sys/ioctl.h>
#include <unistd.h>

namespace gist {

std::string elide(const std::string& text, std::optional<std::size_t> width) {
    if (!width) return text;
    if (*width < 3) return text;  // Prevent underflow
    if (text.size() <= *width) return text;
    return text.substr(0, *width - 3) + "...";
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) != 0;
}

std::optional<std::size_t> terminal_width() {
    if (!isatty(STDOUT_FILENO)) {
        return std::nullopt;
    }

    struct winsize ws {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(ws.ws_col);
}

std::string format_summary(const GistSummary& summary) {
    std::string line = summary.id;
    line += summary.is_public ? " + " : " - ";
    line += summary.description.value_or("");
    return line;
}

std::string format_list(const std::vector<GistSummary>& gists,
                        std::optional<std::size_t> width) {
    std::string out;
    for (const auto& gist : gists) {
        out += elide(format_summary(gist), width);
        out += "\n";
    }
    return out;
}

std::string format_files(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        out += name;
        out += "\n";
    }
    return out;
}

std::string format_content(const std::map<std::string, std::string>& files) {
    std::string out;
    for (const auto& [name, content] : files) {
        out += name + ":\n";
        out += content;
        if (!content.empty() && content.back() != '\n') {
            out += "\n";
        }
        out += "\n";
    }
    return out;
}

}  // namespace gist
