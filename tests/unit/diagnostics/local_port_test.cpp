#include <gtest/gtest.h>

#include <nimbus/diagnostics/local_port.h>

#include <unistd.h>

#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>

using namespace nimbus;
using namespace nimbus::diagnostics;

namespace {

class SystemPortInspectorTest : public ::testing::Test {
protected:
    // Listens on an ephemeral loopback port and returns it.
    std::uint16_t listen() {
        acceptor.open(boost::asio::ip::tcp::v4());
        acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        using boost::asio::ip::tcp;
        acceptor.bind(tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        acceptor.listen();
        return acceptor.local_endpoint().port();
    }

    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    SystemPortInspector inspector;
};

} // namespace

TEST_F(SystemPortInspectorTest, ListeningPortIsReportedBusy) {
    const auto port = listen();

    auto res = inspector.inspect(port);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res.value().port, port);
    EXPECT_FALSE(res.value().available);
    // The holder is this process when /proc is readable.
    if (res.value().occupant && res.value().occupant->pid) {
        EXPECT_EQ(*res.value().occupant->pid, static_cast<std::uint32_t>(::getpid()));
        EXPECT_FALSE(res.value().occupant->systemCritical);
    }
}

TEST_F(SystemPortInspectorTest, ReleasedPortIsAvailableAgain) {
    const auto port = listen();
    acceptor.close();

    auto res = inspector.inspect(port);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_TRUE(res.value().available);
    EXPECT_FALSE(res.value().occupant.has_value());
}

TEST_F(SystemPortInspectorTest, PortZeroIsRejected) {
    auto res = inspector.inspect(0);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
}
