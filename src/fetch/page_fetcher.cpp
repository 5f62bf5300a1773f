#include "searxmcp/fetch/page_fetcher.hpp"

#include "searxmcp/exceptions.hpp"

#include <curl/curl.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace searxmcp::fetch
{

namespace
{

std::once_flag curl_init_flag;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* buf = static_cast<std::string*>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

CurlPageFetcher::CurlPageFetcher(int timeout_s, std::string user_agent)
    : timeout_s_(timeout_s), user_agent_(std::move(user_agent))
{
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

FetchedPage CurlPageFetcher::fetch(const std::string& url)
{
    CURL* curl = curl_easy_init();
    if (!curl)
        throw TransportError("libcurl init failed");

    FetchedPage page;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &page.body);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s_));

    CURLcode code = curl_easy_perform(curl);
    if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &page.status) != CURLE_OK)
        page.status = 0;
    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
        content_type)
        page.content_type = content_type;
    curl_easy_cleanup(curl);

    if (code == CURLE_OPERATION_TIMEDOUT)
        throw TimeoutError("timeout accessing URL");
    if (code != CURLE_OK)
        throw TransportError(curl_easy_strerror(code));

    spdlog::debug("Fetched {} ({} bytes, status {}, type '{}')", url, page.body.size(),
                  page.status, page.content_type);
    return page;
}

} // namespace searxmcp::fetch
