#pragma once

#include <chrono>
#include <string>

namespace storyguard::net {

// POSTs `body` as application/json and discards the response body. Throws
// std::runtime_error on transport failure or a non-2xx status.
void post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout);

} // namespace storyguard::net
