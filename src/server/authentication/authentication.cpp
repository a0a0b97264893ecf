#include "authentication.hpp"
#include "common/protocol/protocol.hpp"
#include "logger/Mylogger.hpp"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace Authentication
{
    bool verify_api_key(const std::string &token, const std::string &api_key)
    {
        if (token.empty() || api_key.empty())
        {
            return false;
        }
        if (token.size() != api_key.size())
        {
            return false;
        }
        return CRYPTO_memcmp(token.data(), api_key.data(), token.size()) == 0;
    }

    bool authenticate_request(const httplib::Request &req, httplib::Response &res, const std::string &api_key)
    {
        MyLogger::debug("Inside authenticate_request");

        auto token = protocol::extractBearer(req.get_header_value(protocol::HEADER_AUTHORIZATION));
        if (!token || !verify_api_key(*token, api_key))
        {
            res.status = 401;
            res.set_content(protocol::errorBody("Invalid or missing API key"), protocol::CONTENT_TYPE_JSON);
            MyLogger::error("Authentication failed: invalid or missing API key from " + req.remote_addr);
            return false;
        }
        return true;
    }

    std::string generate_api_key()
    {
        std::vector<unsigned char> bytes(32);
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
        {
            MyLogger::error("RAND_bytes failed while generating API key");
            throw std::runtime_error("Failed to generate API key");
        }

        std::ostringstream hex;
        for (unsigned char byte : bytes)
        {
            hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
        }
        return hex.str();
    }
}
