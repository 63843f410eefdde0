#include <gtest/gtest.h>
#include "http_server.hpp"
#include "ankiplace/canvas.hpp"
#include "ankiplace/durable_store.hpp"
#include "ankiplace/read_pool.hpp"
#include "ankiplace/write_serializer.hpp"
#include "temp_store.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace ankiplace;
using namespace std::chrono_literals;
using ankiplace::testing::TempDir;

namespace {

// Blocking test client
class Client {
public:
    explicit Client(uint16_t port) : socket_(::socket(AF_INET, SOCK_STREAM, 0)) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        connected_ = ::connect(socket_.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;

        timeval timeout{5, 0};
        setsockopt(socket_.fd(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    }

    bool connected() const { return connected_; }

    void send(const std::string& data) {
        [[maybe_unused]] ssize_t _ = ::send(socket_.fd(), data.data(), data.size(), MSG_NOSIGNAL);
    }

    // One full response, split on Content-Length; empty on EOF or timeout
    std::string read_response() {
        while (true) {
            auto head_end = buffer_.find("\r\n\r\n");
            if (head_end != std::string::npos) {
                size_t length = 0;
                auto pos = buffer_.find("Content-Length: ");
                if (pos != std::string::npos && pos < head_end)
                    length = std::stoul(buffer_.substr(pos + 16));
                size_t total = head_end + 4 + length;
                if (buffer_.size() >= total) {
                    std::string response = buffer_.substr(0, total);
                    buffer_.erase(0, total);
                    return response;
                }
            }
            char chunk[4096];
            ssize_t n = ::recv(socket_.fd(), chunk, sizeof(chunk), 0);
            if (n <= 0)
                return {};
            buffer_.append(chunk, n);
        }
    }

    // True once the server has closed its end
    bool closed_by_peer() {
        char byte;
        return ::recv(socket_.fd(), &byte, 1, 0) == 0;
    }

private:
    UniqueFd socket_;
    bool connected_{false};
    std::string buffer_;
};

} // namespace

class HttpServerTest : public ::testing::Test {
protected:
    TempDir dir;
    DurableStore store{dir.file("canvas.db"), canvas::create_schema};
    ReadPool pool{store, ReadPool::Options{}};
    WriteSerializer serializer{store.writer(), WriteSerializer::Options{}};
    Gateway gateway{pool, serializer, "secret", 5s};
    HttpServer server{gateway, 4};
    uint16_t port{0};
    std::jthread reactor;

    void SetUp() override {
        port = server.listen(0);
        ASSERT_NE(port, 0);
        reactor = std::jthread([this]() { server.run(); });
        for (int spin = 0; spin < 500 && !server.is_running(); spin++)
            std::this_thread::sleep_for(1ms);
    }

    void TearDown() override {
        server.stop();
        if (reactor.joinable())
            reactor.join();
    }
};


TEST_F(HttpServerTest, ServesCanvas) {
    EXPECT_EQ(server.port(), port);
    Client client{port};
    ASSERT_TRUE(client.connected());
    client.send("GET /canvas HTTP/1.1\r\nHost: localhost\r\n\r\n");
    std::string response = client.read_response();
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(response.find("Content-Type: application/json"), std::string::npos);
    EXPECT_NE(response.find("\"canvas\""), std::string::npos);
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests) {
    Client client{port};
    for (int i = 0; i < 3; i++) {
        client.send("GET /pixel/1/1 HTTP/1.1\r\n\r\n");
        std::string response = client.read_response();
        EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
        EXPECT_NE(response.find("Connection: keep-alive"), std::string::npos);
    }
}

TEST_F(HttpServerTest, PipelinedResponsesKeepOrder) {
    Client client{port};
    client.send("GET /user/nobody HTTP/1.1\r\n\r\n"
                "GET /pixel/2/3 HTTP/1.1\r\n\r\n"
                "GET /nowhere HTTP/1.1\r\n\r\n");
    EXPECT_EQ(client.read_response().rfind("HTTP/1.1 404", 0), 0u);
    EXPECT_EQ(client.read_response().rfind("HTTP/1.1 200", 0), 0u);
    std::string last = client.read_response();
    EXPECT_EQ(last.rfind("HTTP/1.1 404", 0), 0u);
    EXPECT_NE(last.find("Not Found"), std::string::npos);
}

TEST_F(HttpServerTest, PostWithBody) {
    Client client{port};
    std::string body = R"({"username": "ann"})";
    client.send("POST /user HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: " +
                std::to_string(body.size()) + "\r\n\r\n" + body);
    std::string response = client.read_response();
    EXPECT_EQ(response.rfind("HTTP/1.1 200", 0), 0u) << response;
    EXPECT_NE(response.find("\"user_id\""), std::string::npos);
}

TEST_F(HttpServerTest, ConnectionCloseHonored) {
    Client client{port};
    client.send("GET /canvas HTTP/1.1\r\nConnection: close\r\n\r\n");
    std::string response = client.read_response();
    EXPECT_NE(response.find("Connection: close"), std::string::npos);
    EXPECT_TRUE(client.closed_by_peer());
}

TEST_F(HttpServerTest, MalformedRequestAnsweredThenClosed) {
    Client client{port};
    client.send("NOT A REQUEST\r\n\r\n");
    std::string response = client.read_response();
    EXPECT_EQ(response.rfind("HTTP/1.1 400", 0), 0u) << response;
    EXPECT_TRUE(client.closed_by_peer());
}

TEST_F(HttpServerTest, ChunkedUploadRefused) {
    Client client{port};
    client.send("POST /user HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
    EXPECT_EQ(client.read_response().rfind("HTTP/1.1 501", 0), 0u);
}

TEST_F(HttpServerTest, StopReturnsFromRun) {
    server.stop();
    reactor.join();
    EXPECT_FALSE(server.is_running());
}
