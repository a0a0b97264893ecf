#include "filename_policy.hpp"
#include "common/protocol/protocol.hpp"
#include <stdexcept>

namespace naming
{
    RequestContext contextFrom(const httplib::Request &req)
    {
        return RequestContext{req.remote_addr, req.path, req.headers};
    }

    std::string sanitizeBasename(const std::string &clientFilename)
    {
        auto pos = clientFilename.find_last_of("/\\");
        std::string base = pos == std::string::npos ? clientFilename : clientFilename.substr(pos + 1);
        if (base.empty() || base == "." || base == "..")
        {
            return protocol::DEFAULT_CLIENT_FILENAME;
        }
        return base;
    }

    std::string BasenamePolicy::resolve(const std::string &clientFilename, int, const RequestContext &)
    {
        return sanitizeBasename(clientFilename);
    }

    CallbackPolicy::CallbackPolicy(Generator generator) : generator_(std::move(generator))
    {
        if (!generator_)
        {
            throw std::invalid_argument("CallbackPolicy needs a generator");
        }
    }

    std::string CallbackPolicy::resolve(const std::string &clientFilename, int chunkIndex,
                                        const RequestContext &context)
    {
        return sanitizeBasename(generator_(clientFilename, chunkIndex, context));
    }
}
