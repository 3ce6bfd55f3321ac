#include "srvlist/endpoint.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using srvlist::Endpoint;

TEST(Endpoint, HostOnlyUsesDefaultPortAndHostAsNetwork) {
    Endpoint const endpoint = Endpoint::from_str("s1.example");

    EXPECT_EQ(endpoint.host(), "s1.example");
    EXPECT_EQ(endpoint.network(), "s1.example");
    EXPECT_EQ(endpoint.port(), srvlist::DEFAULT_PORT);
    EXPECT_EQ(endpoint.str(), "s1.example:5222");
}

TEST(Endpoint, NetworkHostAndPort) {
    Endpoint const endpoint
        = Endpoint::from_str("beta.example.net|prime.example.net:7222");

    EXPECT_EQ(endpoint.network(), "beta.example.net");
    EXPECT_EQ(endpoint.host(), "prime.example.net");
    EXPECT_EQ(endpoint.port(), 7222);
    EXPECT_EQ(endpoint.str(), "beta.example.net|prime.example.net:7222");
}

TEST(Endpoint, Ipv4Literal) {
    Endpoint const endpoint = Endpoint::from_str("192.0.2.10:5223");

    EXPECT_EQ(endpoint.host(), "192.0.2.10");
    EXPECT_EQ(endpoint.port(), 5223);
}

TEST(Endpoint, CanonicalFormParsesBack) {
    for (std::string const str :
         {"a.example", "n.example|h.example", "h.example:1", "x-y.example."}) {
        Endpoint const endpoint = Endpoint::from_str(str);
        EXPECT_EQ(Endpoint::from_str(endpoint.str()), endpoint) << str;
    }
}

TEST(Endpoint, Formatter) {
    EXPECT_EQ(fmt::format("{}", Endpoint::from_str("h.example:80")), "h.example:80");
}

TEST(Endpoint, EqualityComparesAllParts) {
    EXPECT_EQ(Endpoint::from_str("h.example"), Endpoint::from_str("h.example:5222"));
    EXPECT_FALSE(
        Endpoint::from_str("h.example:1") == Endpoint::from_str("h.example:2")
    );
    EXPECT_FALSE(
        Endpoint::from_str("a.example|h.example")
        == Endpoint::from_str("b.example|h.example")
    );
}

TEST(Endpoint, RejectsMalformedInput) {
    for (std::string const str : {
             "",
             ":5222",
             "h.example:",
             "h.example:0",
             "h.example:65536",
             "h.example:52x",
             "|h.example",
             "n.example|",
             "bad host.example",
             "under_score.example",
             "-dash.example",
             "dash-.example",
             "double..dot",
             ".",
         }) {
        EXPECT_THROW((void) Endpoint::from_str(str), std::invalid_argument)
            << "'" << str << "'";
    }
}

TEST(Endpoint, RejectsOverlongNames) {
    std::string const long_label(64, 'a');
    EXPECT_THROW(
        (void) Endpoint::from_str(long_label + ".example"),
        std::invalid_argument
    );

    std::string long_name;
    while (long_name.size() <= srvlist::MAX_HOST_NAME_LEN) {
        long_name += "abcdefgh.";
    }
    long_name += "example";
    EXPECT_THROW((void) Endpoint::from_str(long_name), std::invalid_argument);
}
