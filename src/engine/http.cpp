#include "http.hpp"
#include <curl/curl.h>

namespace tessera::engine {

    namespace {
        size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }
    }

    void http_global_init() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    void http_global_cleanup() {
        curl_global_cleanup();
    }

    HttpResponse http_post_json(const std::string& url,
                                const std::string& json_body,
                                long timeout_ms,
                                const std::vector<std::string>& extra_headers) {
        HttpResponse response;

        CURL* curl = curl_easy_init();
        if (!curl) {
            response.error = "curl_easy_init failed";
            return response;
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        for (const auto& header : extra_headers) {
            headers = curl_slist_append(headers, header.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (timeout_ms > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
        }

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
            response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        } else {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return response;
    }

}
