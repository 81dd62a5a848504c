#include "lanshare/client/share_client.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <thread>

using namespace lanshare::client;
using namespace lanshare::testing;
using lanshare::ErrorCode;

namespace {

// Plain loopback TCP connection that sends nothing unless asked
class RawConnection {
public:
    explicit RawConnection(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            return;
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        connected_ = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    ~RawConnection() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    RawConnection(const RawConnection&) = delete;
    RawConnection& operator=(const RawConnection&) = delete;

    bool connected() const { return connected_; }

    std::string read_some() {
        timeval tv{};
        tv.tv_sec = 5;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        char buffer[512];
        const ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
        return n > 0 ? std::string(buffer, static_cast<size_t>(n)) : std::string();
    }

private:
    int fd_ = -1;
    bool connected_ = false;
};

template<typename Predicate>
bool wait_for(Predicate predicate, std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

} // namespace

TEST(ServerBackpressureTest, FullQueueAnswers503AndClientSeesUnreachable) {
    TempDir dir("lanshare_busy");
    write_file(dir / "share/a.txt", "a");

    lanshare::server::ServerOptions options;
    options.http.worker_threads = 1;
    options.http.queue_limit = 1;
    options.http.io_timeout = std::chrono::seconds(10);
    RunningServer server(dir / "share", options);

    // The only worker blocks reading a request that never comes
    RawConnection busy(server.port());
    ASSERT_TRUE(busy.connected());
    ASSERT_TRUE(wait_for([&] { return server.server().active_connections() == 1; }));

    // Fills the single queue slot
    RawConnection queued(server.port());
    ASSERT_TRUE(queued.connected());

    RawConnection rejected(server.port());
    ASSERT_TRUE(rejected.connected());
    const std::string reply = rejected.read_some();
    EXPECT_EQ(reply.rfind("HTTP/1.1 503", 0), 0u) << reply;

    ClientOptions client_options;
    client_options.listing.timeout = std::chrono::milliseconds(5000);
    ShareClient client(client_options);
    auto listing = client.list_files(Endpoint{"127.0.0.1", server.port()});
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Unreachable);

    EXPECT_GE(server.server().rejected_connections(), 2u);
}
