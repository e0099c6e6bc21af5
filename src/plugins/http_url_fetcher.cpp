// http_url_fetcher.cpp - Plain URL downloads for plugin jars
// Part of jarcache - Server Artifact Cache

#include "plugins/http_url_fetcher.hpp"

#include <httplib.h>

#include <iostream>

namespace jarcache {

namespace {

[[noreturn]] void fetch_failed(const std::string& url, const std::string& reason) {
    throw CacheError(ErrorKind::DOWNLOAD_FAILED, "Download failed: " + url, {reason});
}

} // namespace

HttpUrlFetcher::HttpUrlFetcher(bool verbose, int connect_timeout_sec, int read_timeout_sec)
    : verbose_(verbose)
    , connect_timeout_sec_(connect_timeout_sec)
    , read_timeout_sec_(read_timeout_sec) {
}

void HttpUrlFetcher::fetch(const std::string& url, const FetchSink& sink) {
    // Split "scheme://host[:port]" from the request path
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        fetch_failed(url, "Not an absolute URL");
    }
    size_t path_start = url.find('/', scheme_end + 3);
    std::string origin = url.substr(0, path_start);
    std::string path = path_start == std::string::npos ? "/" : url.substr(path_start);

    if (verbose_) {
        std::cout << "[HTTP] GET " << url << "\n";
    }

    httplib::Client client(origin);
    if (!client.is_valid()) {
        fetch_failed(url, "Unsupported URL");
    }
    client.set_follow_location(true);
    client.set_connection_timeout(connect_timeout_sec_, 0);
    client.set_read_timeout(read_timeout_sec_, 0);

    int status = 0;
    auto res = client.Get(
        path,
        [&](const httplib::Response& response) {
            status = response.status;
            return status == 200;
        },
        [&](const char* data, size_t length) {
            sink(data, length);
            return true;
        });

    if (status != 0 && status != 200) {
        fetch_failed(url, "HTTP status " + std::to_string(status));
    }
    if (!res) {
        fetch_failed(url, "Connection failed: " + httplib::to_string(res.error()));
    }
}

} // namespace jarcache
