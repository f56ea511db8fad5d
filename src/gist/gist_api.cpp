#include <gist/gist_api.hpp>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>

namespace gist {

using json = nlohmann::json;

// ============================================================================
// HttpClient
// ============================================================================

namespace {

size_t buffer_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total_size = size * nmemb;
    buffer->append(ptr, total_size);
    return total_size;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

std::string user_agent() {
    return std::string("gist-cli/") + GIST_VERSION;
}

}  // namespace

HttpClient::HttpClient(long timeout_ms) : timeout_ms_(timeout_ms) {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    curl_handle_ = curl_easy_init();
}

HttpClient::~HttpClient() {
    if (curl_handle_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_handle_));
        curl_handle_ = nullptr;
    }
}

Result<HttpResponse> HttpClient::request(const std::string& method,
                                         const std::string& url,
                                         const std::vector<std::string>& headers,
                                         const std::string& body) {
    if (!curl_handle_) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    CURL* curl = static_cast<CURL*>(curl_handle_);
    curl_easy_reset(curl);

    SlistPtr header_list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            return Error(ErrorCode::INTERNAL_ERROR, "Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent().c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, buffer_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        if (!body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        }
    }

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Error(ErrorCode::TIMEOUT, "Request to " + url + " timed out");
        }
        return Error(ErrorCode::NETWORK_ERROR,
                     "Cannot reach " + url + ": " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

// ============================================================================
// JSON helpers
// ============================================================================

Result<std::vector<GistSummary>> parse_gist_list(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_array()) {
            return Error(ErrorCode::REMOTE_ERROR, "Unexpected gist list response");
        }

        std::vector<GistSummary> gists;
        for (const auto& item : j) {
            GistSummary summary;
            summary.id = item.at("id").get<std::string>();
            summary.is_public = item.value("public", false);
            if (item.contains("description") && item["description"].is_string()) {
                summary.description = item["description"].get<std::string>();
            }
            gists.push_back(std::move(summary));
        }
        return gists;
    } catch (const json::exception& e) {
        return Error(ErrorCode::REMOTE_ERROR,
                     std::string("Failed to parse gist list: ") + e.what());
    }
}

Result<std::vector<GistFileEntry>> parse_gist_files(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("files") || !j["files"].is_object()) {
            return Error(ErrorCode::REMOTE_ERROR, "Gist response has no files");
        }

        std::vector<GistFileEntry> files;
        for (const auto& [name, file] : j["files"].items()) {
            GistFileEntry entry;
            entry.name = name;
            if (file.contains("content") && file["content"].is_string()) {
                entry.content = file["content"].get<std::string>();
            }
            entry.truncated = file.value("truncated", false);
            if (file.contains("raw_url") && file["raw_url"].is_string()) {
                entry.raw_url = file["raw_url"].get<std::string>();
            }
            files.push_back(std::move(entry));
        }
        return files;
    } catch (const json::exception& e) {
        return Error(ErrorCode::REMOTE_ERROR,
                     std::string("Failed to parse gist: ") + e.what());
    }
}

Result<CreatedGist> parse_created_gist(const std::string& body) {
    try {
        auto j = json::parse(body);
        CreatedGist created;
        created.id = j.at("id").get<std::string>();
        created.html_url = j.value("html_url", "");
        return created;
    } catch (const json::exception& e) {
        return Error(ErrorCode::REMOTE_ERROR,
                     std::string("Failed to parse create response: ") + e.what());
    }
}

std::string build_create_body(const std::string& description,
                              const ContentPlan& plan,
                              bool is_public) {
    json request;
    request["description"] = description;
    request["public"] = is_public;

    json files = json::object();
    for (const auto& [name, content] : plan) {
        files[name] = {{"content", content}};
    }
    request["files"] = files;

    return request.dump();
}

Result<std::string> pretty_json(const std::string& body) {
    try {
        return json::parse(body).dump(2);
    } catch (const json::exception& e) {
        return Error(ErrorCode::REMOTE_ERROR,
                     std::string("Invalid JSON from server: ") + e.what());
    }
}

Error error_from_response(long status, const std::string& body) {
    std::string message;
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("message") && j["message"].is_string()) {
            message = j["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Non-JSON error page; fall back to the status code alone
    }

    std::string text = "HTTP " + std::to_string(status);
    if (!message.empty()) {
        text += ": " + message;
    }

    if (status == 401 || status == 403) {
        return Error(ErrorCode::AUTH_ERROR, text);
    }
    if (status == 404) {
        return Error(ErrorCode::NOT_FOUND, text);
    }
    return Error(ErrorCode::REMOTE_ERROR, text);
}

// ============================================================================
// GithubGistApi
// ============================================================================

GithubGistApi::GithubGistApi(const Config& config, Logger* logger)
    : api_url_(config.api_url)
    , token_(config.token)
    , logger_(logger) {}

std::vector<std::string> GithubGistApi::api_headers() const {
    return {
        "Authorization: token " + token_,
        "Accept: application/vnd.github.v3+json",
        "Content-Type: application/json",
    };
}

Result<std::string> GithubGistApi::call(const std::string& method,
                                        const std::string& path,
                                        const std::string& body) {
    std::string url = api_url_ + path;
    if (logger_) logger_->debug(method + " " + url);

    auto response = http_.request(method, url, api_headers(), body);
    if (!response.ok()) {
        return response.error();
    }

    long status = response.value().status;
    if (logger_) logger_->debug("HTTP " + std::to_string(status));

    if (status < 200 || status >= 300) {
        return error_from_response(status, response.value().body);
    }
    return std::move(response.value().body);
}

Result<std::string> GithubGistApi::fetch_gist(const GistId& id) {
    return call("GET", "/gists/" + id);
}

Result<std::vector<GistSummary>> GithubGistApi::list() {
    std::vector<GistSummary> all;

    for (int page = 1;; ++page) {
        auto body = call("GET", "/gists?per_page=" + std::to_string(LIST_PAGE_SIZE) +
                                "&page=" + std::to_string(page));
        if (!body.ok()) {
            return body.error();
        }

        auto gists = parse_gist_list(body.value());
        if (!gists.ok()) {
            return gists.error();
        }

        size_t count = gists.value().size();
        for (auto& g : gists.value()) {
            all.push_back(std::move(g));
        }
        if (count < static_cast<size_t>(LIST_PAGE_SIZE)) {
            break;
        }
    }

    return all;
}

Result<std::string> GithubGistApi::info(const GistId& id) {
    auto body = fetch_gist(id);
    if (!body.ok()) {
        return body.error();
    }
    return pretty_json(body.value());
}

Result<CreatedGist> GithubGistApi::create(const std::string& description,
                                          const ContentPlan& plan,
                                          bool is_public) {
    auto body = call("POST", "/gists", build_create_body(description, plan, is_public));
    if (!body.ok()) {
        return body.error();
    }
    return parse_created_gist(body.value());
}

Result<CreatedGist> GithubGistApi::fork(const GistId& id) {
    auto body = call("POST", "/gists/" + id + "/forks");
    if (!body.ok()) {
        return body.error();
    }
    return parse_created_gist(body.value());
}

Result<void> GithubGistApi::remove(const GistId& id) {
    auto body = call("DELETE", "/gists/" + id);
    if (!body.ok()) {
        return body.error();
    }
    return Ok();
}

Result<std::vector<std::string>> GithubGistApi::files(const GistId& id) {
    auto body = fetch_gist(id);
    if (!body.ok()) {
        return body.error();
    }

    auto entries = parse_gist_files(body.value());
    if (!entries.ok()) {
        return entries.error();
    }

    std::vector<std::string> names;
    for (const auto& entry : entries.value()) {
        names.push_back(entry.name);
    }
    return names;
}

Result<std::map<std::string, std::string>> GithubGistApi::content(const GistId& id) {
    auto body = fetch_gist(id);
    if (!body.ok()) {
        return body.error();
    }

    auto entries = parse_gist_files(body.value());
    if (!entries.ok()) {
        return entries.error();
    }

    std::map<std::string, std::string> files;
    for (auto& entry : entries.value()) {
        // The API inlines at most ~1MB per file; fetch the rest from raw_url
        if (entry.truncated && !entry.raw_url.empty()) {
            if (logger_) logger_->debug("GET " + entry.raw_url);
            auto raw = http_.request("GET", entry.raw_url, {});
            if (!raw.ok()) {
                return raw.error();
            }
            if (raw.value().status < 200 || raw.value().status >= 300) {
                return error_from_response(raw.value().status, raw.value().body);
            }
            entry.content = std::move(raw.value().body);
        }
        files[entry.name] = std::move(entry.content);
    }
    return files;
}

}  // namespace gist
