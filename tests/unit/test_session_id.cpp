#include <gtest/gtest.h>
#include <set>
#include <string>

#include <termpane/session.hpp>

#include "core/session_id.hpp"

using namespace termpane;

// ─── Session ids ─────────────────────────────────────────────────────────────

TEST(SessionIdGenerate, CanonicalVersion4)
{
    const SessionId id = generate_session_id();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_TRUE(is_valid_session_id(id));
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
    for (char c : id)
        EXPECT_FALSE(c >= 'A' && c <= 'F');
}

TEST(SessionIdGenerate, Unique)
{
    std::set<SessionId> ids;
    for (int i = 0; i < 1000; ++i)
        ids.insert(generate_session_id());
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(SessionIdValidate, AcceptsEitherCase)
{
    EXPECT_TRUE(is_valid_session_id("3f2504e0-4f89-41d3-9a0c-0305e82c3301"));
    EXPECT_TRUE(is_valid_session_id("3F2504E0-4F89-41D3-9A0C-0305E82C3301"));
}

TEST(SessionIdValidate, RejectsMalformed)
{
    EXPECT_FALSE(is_valid_session_id(""));
    EXPECT_FALSE(is_valid_session_id("3f2504e04f8941d39a0c0305e82c3301"));
    EXPECT_FALSE(is_valid_session_id("3f2504e0-4f89-41d3-9a0c-0305e82c330"));
    EXPECT_FALSE(is_valid_session_id("3f2504e0-4f89-41d3-9a0c-0305e82c33011"));
    EXPECT_FALSE(is_valid_session_id("3f2504e0_4f89-41d3-9a0c-0305e82c3301"));
    EXPECT_FALSE(is_valid_session_id("3f2504e0-4f89-41d3-9a0c-0305e82c330g"));
    EXPECT_FALSE(is_valid_session_id("{3f2504e0-4f89-41d3-9a0c-0305e82c33}"));
}

TEST(SessionIdShort, FirstEightCharacters)
{
    EXPECT_EQ(short_session_id("3f2504e0-4f89-41d3-9a0c-0305e82c3301"), "3f2504e0");
    EXPECT_EQ(short_session_id("abc"), "abc");
}

// ─── Session helpers ─────────────────────────────────────────────────────────

TEST(SessionTitle, DefaultsFromWorkingDirectory)
{
    EXPECT_EQ(default_session_title(std::nullopt), "Terminal");
    EXPECT_EQ(default_session_title(std::string()), "Terminal");
    EXPECT_EQ(default_session_title(std::string("/home/me/project")), "project");
    EXPECT_EQ(default_session_title(std::string("/home/me/project/")), "project");
    EXPECT_EQ(default_session_title(std::string("/")), "/");
    EXPECT_EQ(default_session_title(std::string("relative")), "relative");
}

TEST(SessionCommand, QuotesPath)
{
    EXPECT_EQ(shell_quote("/tmp/a b"), "'/tmp/a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(change_directory_command("/srv/app"), "cd '/srv/app' && clear\n");
}

TEST(SessionSurfaceState, AttachDetach)
{
    SessionSurface surface;
    EXPECT_FALSE(surface.is_attached());
    EXPECT_EQ(surface.host_id(), SessionSurface::NO_HOST);

    surface.attach(7, Rect{1, 2, 3, 4});
    EXPECT_TRUE(surface.is_attached());
    EXPECT_EQ(surface.host_id(), 7u);
    EXPECT_EQ(surface.frame(), (Rect{1, 2, 3, 4}));
    EXPECT_EQ(surface.attach_count(), 1u);

    surface.detach();
    EXPECT_FALSE(surface.is_attached());
    EXPECT_EQ(surface.frame(), (Rect{1, 2, 3, 4}));
}
