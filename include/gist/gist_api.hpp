#pragma once

#include <gist/result.hpp>
#include <gist/types.hpp>
#include <gist/util/logger.hpp>

#include <map>
#include <string>
#include <vector>

namespace gist {

/**
 * Remote gist operations.
 */
class GistApi {
public:
    virtual ~GistApi() = default;

    virtual Result<std::vector<GistSummary>> list() = 0;

    /**
     * Full gist description as pretty-printed JSON.
     */
    virtual Result<std::string> info(const GistId& id) = 0;

    virtual Result<CreatedGist> create(const std::string& description,
                                       const ContentPlan& plan,
                                       bool is_public) = 0;

    virtual Result<CreatedGist> fork(const GistId& id) = 0;

    virtual Result<void> remove(const GistId& id) = 0;

    virtual Result<std::vector<std::string>> files(const GistId& id) = 0;

    virtual Result<std::map<std::string, std::string>> content(const GistId& id) = 0;
};

/**
 * Status and body of an HTTP exchange.
 */
struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * Blocking HTTP client over a single libcurl easy handle.
 *
 * Thread safety: NOT thread-safe.
 */
class HttpClient {
public:
    explicit HttpClient(long timeout_ms = 30000);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * Perform a request. Any HTTP status is a successful Result; only
     * transport failures are errors (NETWORK_ERROR, TIMEOUT).
     */
    Result<HttpResponse> request(const std::string& method,
                                 const std::string& url,
                                 const std::vector<std::string>& headers,
                                 const std::string& body = "");

private:
    void* curl_handle_ = nullptr;
    long timeout_ms_;
};

/**
 * GistApi for the GitHub REST v3 API.
 */
class GithubGistApi : public GistApi {
public:
    explicit GithubGistApi(const Config& config, Logger* logger = nullptr);

    Result<std::vector<GistSummary>> list() override;
    Result<std::string> info(const GistId& id) override;
    Result<CreatedGist> create(const std::string& description,
                               const ContentPlan& plan,
                               bool is_public) override;
    Result<CreatedGist> fork(const GistId& id) override;
    Result<void> remove(const GistId& id) override;
    Result<std::vector<std::string>> files(const GistId& id) override;
    Result<std::map<std::string, std::string>> content(const GistId& id) override;

private:
    std::string api_url_;
    std::string token_;
    Logger* logger_;
    HttpClient http_;

    std::vector<std::string> api_headers() const;

    // Request against the API; non-2xx statuses become errors.
    Result<std::string> call(const std::string& method, const std::string& path,
                             const std::string& body = "");

    Result<std::string> fetch_gist(const GistId& id);
};

// Page size used when listing
constexpr int LIST_PAGE_SIZE = 100;

// ============================================================================
// JSON helpers (no network involved)
// ============================================================================

/**
 * A file entry of a gist response.
 */
struct GistFileEntry {
    std::string name;
    std::string content;
    bool truncated = false;
    std::string raw_url;
};

Result<std::vector<GistSummary>> parse_gist_list(const std::string& body);

Result<std::vector<GistFileEntry>> parse_gist_files(const std::string& body);

Result<CreatedGist> parse_created_gist(const std::string& body);

/**
 * Request body for POST /gists.
 */
std::string build_create_body(const std::string& description,
                              const ContentPlan& plan,
                              bool is_public);

/**
 * Re-indent a JSON document with two spaces.
 */
Result<std::string> pretty_json(const std::string& body);

/**
 * Map a non-2xx response to an Error, using the API "message" if present.
 */
Error error_from_response(long status, const std::string& body);

}  // namespace gist
