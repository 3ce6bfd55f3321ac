#include "srvlist/file_transport.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>
#include <system_error>
#include <vector>

using srvlist::FileTransport;
using srvlist::test::TempDir;
using srvlist::test::write_file;

TEST(FileTransport, ReadsServersSkippingBlanksAndComments) {
    TempDir tmp;
    write_file(
        tmp / "servers.txt",
        "# answer\n  s1.example  \n\n\t\ns2.example:5223\r\n#s3.example\n"
    );

    EXPECT_EQ(
        FileTransport::read_servers(tmp / "servers.txt"),
        (std::vector<std::string> {"s1.example", "s2.example:5223"})
    );
}

TEST(FileTransport, KeepsMalformedEntriesForTheCaller) {
    TempDir tmp;
    write_file(tmp / "servers.txt", "bad host\n");

    EXPECT_EQ(
        FileTransport::read_servers(tmp / "servers.txt"),
        std::vector<std::string> {"bad host"}
    );
}

TEST(FileTransport, MissingFileThrows) {
    TempDir tmp;

    EXPECT_THROW(
        FileTransport::read_servers(tmp / "missing.txt"),
        std::system_error
    );
}
