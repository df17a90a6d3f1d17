/**
 * @file port_set_test.cpp
 * @brief Tests for PortSet construction and parsing
 */

#include "ftpcore/NetErrors.h"
#include "ftpcore/PortSet.h"

#include <gtest/gtest.h>

using namespace FtpCore;

namespace {

const char* codeOf(const std::string& text) {
    try {
        (void)PortSet::parse(text);
    } catch (const ConfigurationError& e) {
        return e.code();
    }
    return "";
}

} // anonymous namespace

TEST(PortSetTest, DefaultIsEmpty) {
    PortSet set;
    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set.size(), 0u);
    EXPECT_EQ(set.minPort(), 0u);
    EXPECT_EQ(set.toString(), "");
}

TEST(PortSetTest, RangeIsInclusive) {
    PortSet set = PortSet::range(50000, 50100);
    EXPECT_EQ(set.size(), 101u);
    EXPECT_EQ(set.minPort(), 50000u);
    EXPECT_EQ(set.maxPort(), 50100u);
    EXPECT_TRUE(set.contains(50000));
    EXPECT_TRUE(set.contains(50100));
    EXPECT_FALSE(set.contains(50101));
}

TEST(PortSetTest, SinglePortRange) {
    PortSet set = PortSet::range(2121, 2121);
    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.toString(), "2121");
}

TEST(PortSetTest, RangeRejectsInvertedBounds) {
    EXPECT_THROW(PortSet::range(50100, 50000), ConfigurationError);
}

TEST(PortSetTest, RangeRejectsPortZeroAndOverflow) {
    EXPECT_THROW(PortSet::range(0, 10), ConfigurationError);
    EXPECT_THROW(PortSet::range(65000, 65536), ConfigurationError);
}

TEST(PortSetTest, ListSortsAndMergesDuplicates) {
    PortSet set = PortSet::list({50010, 50000, 50010, 50005});
    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(set.ports()[0], 50000u);
    EXPECT_EQ(set.ports()[1], 50005u);
    EXPECT_EQ(set.ports()[2], 50010u);
}

TEST(PortSetTest, ListRejectsInvalidPort) {
    EXPECT_THROW(PortSet::list({50000, -1}), ConfigurationError);
    EXPECT_THROW(PortSet::list({70000}), ConfigurationError);
}

TEST(PortSetTest, ParsesRange) {
    EXPECT_EQ(PortSet::parse("50000-50010"), PortSet::range(50000, 50010));
}

TEST(PortSetTest, ParsesMixedListWithWhitespace) {
    PortSet set = PortSet::parse(" 50000-50002 , 50010,50100 ");
    EXPECT_EQ(set, PortSet::list({50000, 50001, 50002, 50010, 50100}));
}

TEST(PortSetTest, BlankTextIsEmptySet) {
    EXPECT_TRUE(PortSet::parse("").empty());
    EXPECT_TRUE(PortSet::parse("   ").empty());
}

TEST(PortSetTest, MalformedTextThrowsInvalidRange) {
    EXPECT_STREQ(codeOf("abc"), ErrorCodes::CONFIG_INVALID_RANGE);
    EXPECT_STREQ(codeOf("50000-"), ErrorCodes::CONFIG_INVALID_RANGE);
    EXPECT_STREQ(codeOf("50000,,50001"), ErrorCodes::CONFIG_INVALID_RANGE);
    EXPECT_STREQ(codeOf("50000,"), ErrorCodes::CONFIG_INVALID_RANGE);
    EXPECT_STREQ(codeOf("50000-50010-50020"), ErrorCodes::CONFIG_INVALID_RANGE);
    EXPECT_STREQ(codeOf("50010-50000"), ErrorCodes::CONFIG_INVALID_RANGE);
}

TEST(PortSetTest, OutOfRangePortThrowsInvalidPort) {
    EXPECT_STREQ(codeOf("0"), ErrorCodes::CONFIG_INVALID_PORT);
    EXPECT_STREQ(codeOf("65536"), ErrorCodes::CONFIG_INVALID_PORT);
    EXPECT_STREQ(codeOf("65000-70000"), ErrorCodes::CONFIG_INVALID_PORT);
}

TEST(PortSetTest, ToStringCompactsRuns) {
    PortSet set = PortSet::list({50000, 50001, 50002, 50010, 50100, 50101});
    EXPECT_EQ(set.toString(), "50000-50002,50010,50100-50101");
    EXPECT_EQ(PortSet::parse(set.toString()), set);
}
