#pragma once

#include <string>
#include <vector>

namespace rfpindex {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * POST a JSON body and return status and body. Extra headers are passed
 * as complete "Name: value" lines.
 * @throws std::runtime_error on transport failure (DNS, connect, timeout)
 */
HttpResponse http_post_json(const std::string& url, const std::string& json_body,
                            const std::vector<std::string>& headers, long timeout_ms);

} // namespace rfpindex
