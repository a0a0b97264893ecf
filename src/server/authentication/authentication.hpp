#pragma once
#include <string>
#include <httplib.h>

namespace Authentication
{
    // Constant-time comparison of a presented token against the shared key
    bool verify_api_key(const std::string &token, const std::string &api_key);

    // Checks "Authorization: Bearer <key>". On failure writes a 401 JSON error
    // into res and returns false; the request body is left untouched.
    bool authenticate_request(const httplib::Request &req, httplib::Response &res, const std::string &api_key);

    // 64 hex characters from 32 random bytes
    std::string generate_api_key();
}
