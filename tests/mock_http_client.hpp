#pragma once
#include "http.hpp"

namespace browsetrail {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::string last_method;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    int call_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long /*timeout_seconds*/) override {
        last_method = "POST";
        last_body = body;
        return record(url, headers);
    }

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long /*timeout_seconds*/) override {
        last_method = "GET";
        last_body.clear();
        return record(url, headers);
    }

    std::string header(const std::string& name) const {
        for (const auto& h : last_headers) {
            if (h.first == name) return h.second;
        }
        return {};
    }

private:
    HttpResponse record(const std::string& url, const std::vector<Header>& headers) {
        call_count++;
        last_url = url;
        last_headers = headers;
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }
};

} // namespace browsetrail
