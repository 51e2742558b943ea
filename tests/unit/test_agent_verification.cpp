#include "../../src/internal/transport/agent_verification.hpp"
#include "../test_utils.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace agentchat;
using namespace agentchat::internal;

namespace
{
const char* ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::string write_file(const test::TempDir& dir, const std::string& name, const std::string& body)
{
    std::string path = dir.file(name);
    std::ofstream out(path, std::ios::binary);
    out << body;
    return path;
}
} // namespace

TEST(AgentVerificationTest, ComputesSha256)
{
    test::TempDir dir;
    auto path = write_file(dir, "abc.bin", "abc");

    auto hash = compute_file_sha256(path);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, ABC_SHA256);

    EXPECT_FALSE(compute_file_sha256(dir.file("missing")).has_value());
}

TEST(AgentVerificationTest, HashCheck)
{
    test::TempDir dir;
    auto path = write_file(dir, "abc.bin", "abc");
    std::string error;

    EXPECT_TRUE(verify_agent_hash(path, std::nullopt, error));
    EXPECT_TRUE(verify_agent_hash(path, std::string(ABC_SHA256), error));

    std::string upper = ABC_SHA256;
    for (auto& c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(verify_agent_hash(path, upper, error));

    EXPECT_FALSE(verify_agent_hash(path, std::string(64, '0'), error));
    EXPECT_NE(error.find("mismatch"), std::string::npos);

    EXPECT_FALSE(verify_agent_hash(path, std::string("xyz"), error));
    EXPECT_NE(error.find("Invalid hash format"), std::string::npos);
}

TEST(AgentVerificationTest, Allowlist)
{
    test::TempDir dir;
    auto path = write_file(dir, "agent", "#!/bin/sh\n");

    EXPECT_TRUE(verify_agent_path_allowed(path, {}));
    EXPECT_TRUE(verify_agent_path_allowed(path, {path}));
    EXPECT_FALSE(verify_agent_path_allowed(path, {dir.file("other")}));
}

TEST(AgentVerificationTest, ExplicitPathWins)
{
    test::TempDir dir;
    auto path = test::write_agent_script(dir, "exit 0");

    AgentOptions options;
    options.agent_path = path;
    EXPECT_EQ(resolve_agent_path(options), path);
}

TEST(AgentVerificationTest, RejectsMissingOrUntrustedBinary)
{
    test::TempDir dir;
    auto path = test::write_agent_script(dir, "exit 0");

    AgentOptions missing;
    missing.agent_path = dir.file("nope");
    EXPECT_THROW(resolve_agent_path(missing), AgentNotInstalledError);

    AgentOptions not_allowed;
    not_allowed.agent_path = path;
    not_allowed.allowed_agent_paths = {"/usr/bin/claude"};
    EXPECT_THROW(resolve_agent_path(not_allowed), AgentNotInstalledError);

    AgentOptions bad_hash;
    bad_hash.agent_path = path;
    bad_hash.agent_hash_sha256 = std::string(64, 'a');
    EXPECT_THROW(resolve_agent_path(bad_hash), AgentNotInstalledError);
}
