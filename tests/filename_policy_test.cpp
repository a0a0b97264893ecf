#include <gtest/gtest.h>
#include <stdexcept>
#include "common/protocol/protocol.hpp"
#include "server/naming/filename_policy.hpp"

using naming::BasenamePolicy;
using naming::CallbackPolicy;
using naming::RequestContext;

TEST(FilenamePolicyTest, BasenameStripsDirectories)
{
    EXPECT_EQ(naming::sanitizeBasename("/home/user/report.pdf"), "report.pdf");
    EXPECT_EQ(naming::sanitizeBasename("C:\\Users\\me\\notes.txt"), "notes.txt");
    EXPECT_EQ(naming::sanitizeBasename("../../etc/passwd"), "passwd");
    EXPECT_EQ(naming::sanitizeBasename("plain.bin"), "plain.bin");
}

TEST(FilenamePolicyTest, DegenerateNamesUseDefault)
{
    for (const std::string name : {"", ".", "..", "dir/", "a/..", "x\\."})
    {
        EXPECT_EQ(naming::sanitizeBasename(name), protocol::DEFAULT_CLIENT_FILENAME) << name;
    }
}

TEST(FilenamePolicyTest, BasenamePolicyIgnoresContext)
{
    BasenamePolicy policy;
    RequestContext context{"10.0.0.1", "/upload", {}};
    EXPECT_EQ(policy.resolve("/tmp/data.csv", 4, context), "data.csv");
}

TEST(FilenamePolicyTest, CallbackSeesRequestAndIsSanitized)
{
    CallbackPolicy policy([](const std::string &client, int index, const RequestContext &context)
                          { return "../" + context.remoteAddr + "_" + std::to_string(index) + "_" + client; });

    RequestContext context{"127.0.0.1", "/upload", {}};
    EXPECT_EQ(policy.resolve("a.txt", 2, context), "127.0.0.1_2_a.txt");
}

TEST(FilenamePolicyTest, CallbackCannotEscapeOutputDir)
{
    CallbackPolicy policy([](const std::string &, int, const RequestContext &)
                          { return std::string(".."); });
    EXPECT_EQ(policy.resolve("a.txt", 0, RequestContext{}), protocol::DEFAULT_CLIENT_FILENAME);
}

TEST(FilenamePolicyTest, CallbackPolicyNeedsGenerator)
{
    EXPECT_THROW(CallbackPolicy(nullptr), std::invalid_argument);
}
