#pragma once

#include <functional>
#include <memory>
#include <string>
#include <httplib.h>

namespace naming
{
    // What a policy may inspect about the delivery it is naming.
    struct RequestContext
    {
        std::string remoteAddr;
        std::string path;
        httplib::Headers headers;
    };

    RequestContext contextFrom(const httplib::Request &req);

    // Final path component of a client-supplied name. Both '/' and '\' count as
    // separators; an empty, "." or ".." result becomes the default filename.
    std::string sanitizeBasename(const std::string &clientFilename);

    // Chooses the target filename a delivered chunk is appended to.
    class FilenamePolicy
    {
    public:
        virtual ~FilenamePolicy() = default;
        virtual std::string resolve(const std::string &clientFilename, int chunkIndex,
                                    const RequestContext &context) = 0;
    };

    class BasenamePolicy : public FilenamePolicy
    {
    public:
        std::string resolve(const std::string &clientFilename, int chunkIndex,
                            const RequestContext &context) override;
    };

    // Adapts a plain function. Its result is sanitized again so a callback can
    // never name a file outside the output directory.
    class CallbackPolicy : public FilenamePolicy
    {
    public:
        using Generator = std::function<std::string(const std::string &, int, const RequestContext &)>;

        explicit CallbackPolicy(Generator generator);

        std::string resolve(const std::string &clientFilename, int chunkIndex,
                            const RequestContext &context) override;

    private:
        Generator generator_;
    };
}
