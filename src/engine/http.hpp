#pragma once

#include <string>
#include <vector>

namespace tessera::engine {

    struct HttpResponse {
        long status = 0;
        std::string body;
        std::string error;      // libcurl error text, empty on transport success
        bool timed_out = false;

        bool ok() const { return error.empty() && status >= 200 && status < 300; }
    };

    /**
     * @brief POSTs a JSON body. Never throws; transport failures are reported in the response.
     */
    HttpResponse http_post_json(const std::string& url,
                                const std::string& json_body,
                                long timeout_ms,
                                const std::vector<std::string>& extra_headers = {});

    /**
     * @brief Process-wide libcurl initialisation. Call once from main before any thread starts.
     */
    void http_global_init();
    void http_global_cleanup();

}
