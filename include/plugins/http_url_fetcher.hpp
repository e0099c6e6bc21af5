#ifndef JARCACHE_HTTP_URL_FETCHER_HPP
#define JARCACHE_HTTP_URL_FETCHER_HPP

// http_url_fetcher.hpp - UrlFetcher over cpp-httplib (http and https)
// Part of jarcache - Server Artifact Cache

#include "plugins/plugin_config.hpp"

#include <string>

namespace jarcache {

class HttpUrlFetcher : public UrlFetcher {
public:
    explicit HttpUrlFetcher(bool verbose = false,
                            int connect_timeout_sec = 10,
                            int read_timeout_sec = 60);

    void fetch(const std::string& url, const FetchSink& sink) override;

private:
    bool verbose_;
    int connect_timeout_sec_;
    int read_timeout_sec_;
};

} // namespace jarcache

#endif // JARCACHE_HTTP_URL_FETCHER_HPP
