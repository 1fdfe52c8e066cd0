#include <gtest/gtest.h>

#include "include/errors.hpp"
#include "include/scp_channel.hpp"

using sigmaxfer::scp_url;

TEST(ScpUrl, AbsolutePathIsKeptAndEscaped) {
    EXPECT_EQ(scp_url("backup.local", 22, "/srv/a b.bin"), "scp://backup.local:22/srv/a%20b.bin");
}

TEST(ScpUrl, RelativePathResolvesAgainstLoginDirectory) {
    EXPECT_EQ(scp_url("h", 2222, "rel/x.bin"), "scp://h:2222/~/rel/x.bin");
}

TEST(ScpUrl, HomePrefixIsNotDoubled) {
    EXPECT_EQ(scp_url("h", 22, "~/data.bin"), "scp://h:22/~/data.bin");
    EXPECT_EQ(scp_url("h", 22, "~/dir/data.bin"), "scp://h:22/~/dir/data.bin");
}

TEST(ScpChannel, OpenRejectsMissingHostOrUser) {
    sigmaxfer::ChannelOptions options;
    options.username = "deploy";
    EXPECT_THROW(sigmaxfer::ScpChannel::open(options), sigmaxfer::ConnectionError);

    options.host = "backup.local";
    options.username.clear();
    EXPECT_THROW(sigmaxfer::ScpChannel::open(options), sigmaxfer::ConnectionError);
}
