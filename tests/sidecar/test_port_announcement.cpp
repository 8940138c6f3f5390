/*
Sandcastle - PortAnnouncement Tests
Role: Verify the pure line → port matcher
Testing Strategy: Literal stdout lines → assert optional port
Coverage: Valid, whitespace, malformed, out of range, prefix mismatch, custom key
*/
#include <gtest/gtest.h>
#include <QCoreApplication>
#include "sidecar/PortAnnouncement.hpp"

TEST(PortAnnouncement, ParsesAnnouncementLine) {
    auto port = parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=31822");
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 31822);
}

TEST(PortAnnouncement, TrimsTrailingWhitespaceAndCarriageReturn) {
    EXPECT_EQ(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=8015  "), std::optional<Port>(8015));
    EXPECT_EQ(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=8015\r"), std::optional<Port>(8015));
    EXPECT_EQ(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT= 8015"), std::optional<Port>(8015));
}

TEST(PortAnnouncement, AcceptsPortRangeEdges) {
    EXPECT_EQ(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=1"), std::optional<Port>(1));
    EXPECT_EQ(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=65535"), std::optional<Port>(65535));
}

TEST(PortAnnouncement, RejectsMalformedNumbers) {
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=notanumber").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=12ab").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=-1").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=+80").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=0x50").has_value());
}

TEST(PortAnnouncement, RejectsOutOfRange) {
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=65536").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=99999999999").has_value());
}

TEST(PortAnnouncement, RequiresPrefixAtLineStart) {
    EXPECT_FALSE(parsePortAnnouncement(u"Server starting on port 3000...").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"[log] SANDCASTLE_SERVER_PORT=31822").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u" SANDCASTLE_SERVER_PORT=31822").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORTS=31822").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT:31822").has_value());
}

TEST(PortAnnouncement, HonoursCustomKey) {
    EXPECT_EQ(parsePortAnnouncement(u"MY_PORT=4242", u"MY_PORT"), std::optional<Port>(4242));
    EXPECT_FALSE(parsePortAnnouncement(u"SANDCASTLE_SERVER_PORT=4242", u"MY_PORT").has_value());
    EXPECT_FALSE(parsePortAnnouncement(u"=4242", u"").has_value());
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
