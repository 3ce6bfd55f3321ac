#include "srvlist/directory.hpp"
#include "srvlist/parse_error.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <random>
#include <set>
#include <string>

using srvlist::Directory;
using srvlist::Endpoint;
using srvlist::ParseError;
using srvlist::test::JAN_2020;
using srvlist::test::seconds_since_epoch;

static Directory make_directory(
    std::int64_t const timestamp,
    std::vector<std::string> const& servers
) {
    Directory directory(seconds_since_epoch(timestamp));
    for (auto const& server : servers) {
        directory.add(Endpoint::from_str(server));
    }
    return directory;
}

TEST(Directory, ParsesTimestampAndServersInIndexOrder) {
    Directory const directory = Directory::parse(
        "# comment\n"
        "! another comment\n"
        "\n"
        "server2 = s2.example\n"
        "timestamp=1577836800\r\n"
        "server1=s1.example:5223\n"
        "server10=s10.example\n",
        "test"
    );

    EXPECT_EQ(directory.timestamp(), seconds_since_epoch(JAN_2020));
    ASSERT_EQ(directory.size(), 3u);
    EXPECT_EQ(directory.endpoints()[0], Endpoint::from_str("s1.example:5223"));
    EXPECT_EQ(directory.endpoints()[1], Endpoint::from_str("s2.example"));
    EXPECT_EQ(directory.endpoints()[2], Endpoint::from_str("s10.example"));
}

TEST(Directory, IgnoresUnknownKeys) {
    Directory const directory = Directory::parse(
        "timestamp=10\nversion=3\nserver=not-indexed\nserver0=zero\nserverx=x\n"
        "server1=s1.example\n",
        "test"
    );

    ASSERT_EQ(directory.size(), 1u);
    EXPECT_EQ(directory.endpoints()[0].host(), "s1.example");
}

TEST(Directory, TimestampOnlyIsValidButEmpty) {
    Directory const directory = Directory::parse("timestamp=10\n", "test");

    EXPECT_TRUE(directory.empty());
    EXPECT_FALSE(directory.pick_random().has_value());
}

TEST(Directory, MissingTimestampFails) {
    EXPECT_THROW(
        (void) Directory::parse("server1=s1.example\n", "test"),
        ParseError
    );
    EXPECT_THROW((void) Directory::parse("", "test"), ParseError);
}

TEST(Directory, MalformedTimestampFails) {
    for (std::string const value : {"", "abc", "12abc", "-5", "1.5"}) {
        EXPECT_THROW(
            (void) Directory::parse("timestamp=" + value + "\n", "test"),
            ParseError
        ) << value;
    }
}

TEST(Directory, InvalidEndpointFailsWithLineNumber) {
    try {
        (void) Directory::parse(
            "timestamp=10\nserver1=ok.example\nserver2=bad host\n",
            "list.properties"
        );
        FAIL() << "expected ParseError";
    } catch (ParseError const& err) {
        std::string const what = err.what();
        EXPECT_NE(what.find("list.properties"), std::string::npos) << what;
        EXPECT_NE(what.find("line 3"), std::string::npos) << what;
    }
}

TEST(Directory, LineWithoutSeparatorFails) {
    EXPECT_THROW(
        (void) Directory::parse("timestamp=10\ngarbage\n", "test"),
        ParseError
    );
}

TEST(Directory, SerializeRoundTrips) {
    Directory const directory = make_directory(
        JAN_2020,
        {"s1.example", "net.example|s2.example:7222", "192.0.2.1:1"}
    );

    Directory const parsed = Directory::parse(directory.serialize(), "test");

    EXPECT_EQ(parsed, directory);
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed.endpoints()[1].network(), "net.example");
}

TEST(Directory, SerializeWritesFlatKeys) {
    std::string const text
        = make_directory(42, {"s1.example", "s2.example"}).serialize();

    EXPECT_NE(text.find("timestamp=42\n"), std::string::npos) << text;
    EXPECT_NE(text.find("server1=s1.example:5222\n"), std::string::npos) << text;
    EXPECT_NE(text.find("server2=s2.example:5222\n"), std::string::npos) << text;
}

/**
 * @test Timestamps past 2262 still serialize with a correct date.
 */
TEST(Directory, FarFutureTimestampRoundTrips) {
    Directory const parsed = Directory::parse(
        "timestamp=10000000000\nserver1=s1.example\n",
        "test"
    );
    std::string const text = parsed.serialize();

    EXPECT_NE(text.find("2286-11-20 17:46:40 UTC"), std::string::npos) << text;
    EXPECT_NE(text.find("timestamp=10000000000\n"), std::string::npos) << text;
    EXPECT_EQ(Directory::parse(text, "test"), parsed);
}

TEST(Directory, LastRepresentableTimestampIsAccepted) {
    Directory const parsed = Directory::parse("timestamp=253402300799\n", "test");

    EXPECT_NE(
        parsed.serialize().find("9999-12-31 23:59:59 UTC"),
        std::string::npos
    );
}

TEST(Directory, OutOfRangeTimestampFails) {
    EXPECT_THROW(
        Directory::parse("timestamp=253402300800\n", "test"),
        ParseError
    );
    EXPECT_THROW(
        Directory::parse("timestamp=9223372036854775807\n", "test"),
        ParseError
    );
}

TEST(Directory, IsNewerThanIsStrict) {
    Directory const older = make_directory(100, {});
    Directory const newer = make_directory(200, {});
    Directory const same = make_directory(200, {"s1.example"});

    EXPECT_TRUE(newer.is_newer_than(older));
    EXPECT_FALSE(older.is_newer_than(newer));
    EXPECT_FALSE(newer.is_newer_than(same));
    EXPECT_FALSE(same.is_newer_than(newer));
    EXPECT_FALSE(newer.is_newer_than(newer));
}

TEST(Directory, PickRandomReturnsMember) {
    Directory const directory
        = make_directory(JAN_2020, {"s1.example", "s2.example", "s3.example"});

    std::set<std::string> seen;
    auto gen = std::mt19937(1234);
    for (int i = 0; i < 200; ++i) {
        auto const endpoint = directory.pick_random(gen);
        ASSERT_TRUE(endpoint.has_value());
        seen.insert(endpoint->host());
    }
    EXPECT_EQ(seen, (std::set<std::string> {"s1.example", "s2.example", "s3.example"}));
}

TEST(Directory, PickRandomSingleEndpoint) {
    Directory const directory = make_directory(JAN_2020, {"only.example"});

    auto const endpoint = directory.pick_random();
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host(), "only.example");
}
