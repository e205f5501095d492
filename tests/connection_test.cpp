/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/internal/connection.hpp"
#include "shelf/internal/file_store.hpp"
#include "shelf/internal/utils.hpp"
#include "shelf/log.hpp"
#include "shelf/server.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using namespace shelf;
using shelf::internal::FileBlobStore;
using shelf::internal::ReadStatus;
using shelf::test::TempDir;

namespace {

bool write_all(int fd, const std::string& s) {
    std::size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

std::string read_to_eof(int fd) {
    std::string out;
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        shelf::set_log_file("");
        cfg.directory = dir.path();
        cfg.io_timeout_sec = 2;
    }

    // Sends raw over a socketpair, half-closes, serves it and returns the
    // bytes written back.
    std::string exchange(const std::string& raw) {
        int sv[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) != 0) return "socketpair failed";
        internal::FdGuard client(sv[0]);
        EXPECT_TRUE(write_all(client.get(), raw));
        ::shutdown(client.get(), SHUT_WR);
        internal::handle_connection_plain(sv[1], cfg, router, "test");
        return read_to_eof(client.get());
    }

    TempDir dir;
    FileBlobStore store{dir.path()};
    Router router{store};
    ServerConfig cfg;
};

} // namespace

TEST_F(ConnectionTest, RootRequest) {
    EXPECT_EQ(exchange("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"), "HTTP/1.1 200 OK\r\n\r\n");
}

TEST_F(ConnectionTest, EchoRequest) {
    EXPECT_EQ(exchange("GET /echo/abc/def HTTP/1.1\r\n\r\n"),
              "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 7\r\n\r\nabc/def");
}

TEST_F(ConnectionTest, UserAgentRequest) {
    EXPECT_EQ(exchange("GET /user-agent HTTP/1.1\r\nuser-agent: xyz\r\n\r\n"),
              "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 3\r\n\r\nxyz");
    EXPECT_EQ(exchange("GET /user-agent HTTP/1.1\r\n\r\n"), "HTTP/1.1 404 Not Found\r\n\r\n");
}

TEST_F(ConnectionTest, Http10IsRejected) {
    const std::string body = "this server only supports HTTP version 1.1.";
    for (const char* raw : {"GET / HTTP/1.0\r\n\r\n",
                            "GET /echo/x HTTP/1.0\r\n\r\n",
                            "POST /files/a HTTP/1.0\r\nContent-Type: application/octet-stream\r\n\r\nx",
                            "DELETE /nowhere HTTP/1.0\r\n\r\n"}) {
        const std::string resp = exchange(raw);
        EXPECT_EQ(resp.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << raw;
        EXPECT_NE(resp.find("\r\n\r\n" + body), std::string::npos) << raw;
    }
    EXPECT_EQ(dir.entry_count(), 0u);
}

TEST_F(ConnectionTest, MalformedRequestLineIsBadRequest) {
    for (const char* raw : {"GARBAGE\r\n\r\n", "PATCH / HTTP/1.1\r\n\r\n", "GET / HTTP/9\r\n\r\n",
                            "GET /a /b HTTP/1.1\r\n\r\n"}) {
        const std::string resp = exchange(raw);
        EXPECT_EQ(resp.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << raw;
        EXPECT_NE(resp.find("malformed request line."), std::string::npos) << raw;
    }
}

TEST_F(ConnectionTest, RequestWithoutBlankLineAtEof) {
    EXPECT_EQ(exchange("GET / HTTP/1.1\r\n"), "HTTP/1.1 200 OK\r\n\r\n");
}

TEST_F(ConnectionTest, UploadThenDownload) {
    const std::string data("\x89PNG\r\n\x1a\n\x00\xff", 10);
    const std::string post =
        "POST /files/foo.bin HTTP/1.1\r\n"
        "Content-Type: application/octet-stream\r\n"
        "Content-Length: 10\r\n"
        "\r\n" + data;
    EXPECT_EQ(exchange(post), "HTTP/1.1 201 Created\r\n\r\n");
    EXPECT_EQ(shelf::test::slurp(dir.path() + "foo.bin"), data);

    const std::string again = exchange(post);
    EXPECT_EQ(again.rfind("HTTP/1.1 409 Conflict\r\n", 0), 0u);
    EXPECT_EQ(shelf::test::slurp(dir.path() + "foo.bin"), data);

    EXPECT_EQ(exchange("GET /files/foo.bin HTTP/1.1\r\n\r\n"),
              "HTTP/1.1 200 OK\r\n"
              "Content-Type: application/octet-stream\r\n"
              "Content-Length: 10\r\n"
              "\r\n" + data);
}

TEST_F(ConnectionTest, UploadWithWrongContentTypeCreatesNothing) {
    const std::string resp = exchange(
        "POST /files/x HTTP/1.1\r\nContent-Type: text/plain\r\nContent-Length: 3\r\n\r\nabc");
    EXPECT_EQ(resp.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_EQ(dir.entry_count(), 0u);
}

TEST_F(ConnectionTest, MissingFileIsNotFound) {
    EXPECT_EQ(exchange("GET /files/nope HTTP/1.1\r\n\r\n"), "HTTP/1.1 404 Not Found\r\n\r\n");
}

TEST_F(ConnectionTest, OversizedRequestIsBadRequest) {
    cfg.max_request = 64;
    const std::string resp = exchange("GET /echo/" + std::string(200, 'a') + " HTTP/1.1\r\n\r\n");
    EXPECT_EQ(resp.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_NE(resp.find("request too large."), std::string::npos);
}

TEST_F(ConnectionTest, ShortUploadStoresNothing) {
    const std::string resp = exchange(
        "POST /files/short.bin HTTP/1.1\r\n"
        "Content-Type: application/octet-stream\r\n"
        "Content-Length: 10\r\n"
        "\r\nabcde");
    EXPECT_EQ(resp.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_NE(resp.find("incomplete request body."), std::string::npos);
    EXPECT_EQ(dir.entry_count(), 0u);
}

TEST_F(ConnectionTest, HugeContentLengthIsTooLarge) {
    const std::string resp = exchange(
        "POST /files/a HTTP/1.1\r\n"
        "Content-Type: application/octet-stream\r\n"
        "Content-Length: 18446744073709551615\r\n"
        "\r\nab");
    EXPECT_NE(resp.find("request too large."), std::string::npos);
    EXPECT_EQ(dir.entry_count(), 0u);
}

TEST(RecvRequestTest, WaitsForContentLengthBody) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);

    const std::string head = "POST /files/a HTTP/1.1\r\nContent-Length: 6\r\n\r\n";
    std::thread writer([&] {
        write_all(client.get(), head + "abc");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        write_all(client.get(), "def");
        // Connection stays open: the reader must stop on Content-Length.
    });

    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 1024, raw), ReadStatus::Ok);
    writer.join();
    EXPECT_EQ(raw, head + "abcdef");
}

TEST(RecvRequestTest, StopsAtBlankLineWithoutContentLength) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);

    // Terminator split across two writes.
    ASSERT_TRUE(write_all(client.get(), "GET / HTTP/1.1\r\nHost: x\r\n\r"));
    std::thread writer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        write_all(client.get(), "\n");
    });

    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 1024, raw), ReadStatus::Ok);
    writer.join();
    EXPECT_EQ(raw, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
}

TEST(RecvRequestTest, ContentLengthAboveLimitIsTooLarge) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);

    ASSERT_TRUE(write_all(client.get(), "POST /files/a HTTP/1.1\r\nContent-Length: 100000\r\n\r\nab"));
    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 4096, raw), ReadStatus::TooLarge);
}

TEST(RecvRequestTest, ContentLengthThatWrapsIsTooLarge) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);

    ASSERT_TRUE(write_all(client.get(),
        "POST /files/a HTTP/1.1\r\nContent-Length: 18446744073709551615\r\n\r\nab"));
    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 4096, raw), ReadStatus::TooLarge);
    EXPECT_TRUE(raw.empty());
}

TEST(RecvRequestTest, ShortBodyAtEofIsIncomplete) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);

    ASSERT_TRUE(write_all(client.get(), "POST /files/a HTTP/1.1\r\nContent-Length: 10\r\n\r\nabcde"));
    ::shutdown(client.get(), SHUT_WR);
    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 1024, raw), ReadStatus::Incomplete);
    EXPECT_TRUE(raw.empty());
}

TEST(RecvRequestTest, ShortBodyAtReceiveTimeoutIsIncomplete) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);

    timeval tv{0, 100 * 1000};
    ASSERT_EQ(::setsockopt(server.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)), 0);
    // Client keeps the connection open but never finishes the body.
    ASSERT_TRUE(write_all(client.get(), "POST /files/a HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc"));
    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 1024, raw), ReadStatus::Incomplete);
}

TEST(RecvRequestTest, DeadlineStopsTricklingClient) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);

    // Each byte arrives well within the per-recv timeout.
    timeval tv{2, 0};
    ASSERT_EQ(::setsockopt(server.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)), 0);
    std::thread writer([&] {
        for (int i = 0; i < 20; ++i) {
            if (!write_all(client.get(), "a")) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    const auto start = std::chrono::steady_clock::now();
    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 1024, raw,
                                          start + std::chrono::milliseconds(200)),
              ReadStatus::TimedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(900));
    writer.join();
}

TEST(RecvRequestTest, SilentPeerIsClosed) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    internal::FdGuard client(sv[0]);
    internal::FdGuard server(sv[1]);
    ::shutdown(client.get(), SHUT_WR);

    std::string raw;
    EXPECT_EQ(internal::recv_http_request(server.get(), 1024, raw), ReadStatus::Closed);
}

TEST(ProcessRequestTest, PipelineWithoutSockets) {
    shelf::set_log_file("");
    shelf::test::MemoryBlobStore store;
    Router router(store);
    EXPECT_EQ(serialize(internal::process_request("GET /echo/same HTTP/1.1\r\n\r\n", router, "t")),
              serialize(internal::process_request("GET /echo/same HTTP/1.1\r\n\r\n", router, "t")));
    EXPECT_EQ(internal::process_request("GET / HTTP/1.0\r\n\r\n", router, "t").status,
              Status::BadRequest);
    EXPECT_EQ(internal::process_request("", router, "t").status, Status::BadRequest);
}

TEST(ServerTest, ServesOverTcp) {
    shelf::set_log_file("");
    TempDir dir;
    ServerConfig cfg;
    cfg.directory = dir.path();
    cfg.port = 0;
    cfg.workers = 2;
    cfg.io_timeout_sec = 2;

    Server srv(cfg);
    std::thread loop([&] { srv.run(); });

    for (int i = 0; i < 200 && srv.bound_port() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_NE(srv.bound_port(), 0);

    auto roundtrip = [&](const std::string& raw) {
        int s = ::socket(AF_INET, SOCK_STREAM, 0);
        internal::FdGuard g(s);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(srv.bound_port());
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) return std::string();
        write_all(s, raw);
        return read_to_eof(s);
    };

    EXPECT_EQ(roundtrip("POST /files/t.bin HTTP/1.1\r\nContent-Type: application/octet-stream\r\n"
                        "Content-Length: 4\r\n\r\ndata"),
              "HTTP/1.1 201 Created\r\n\r\n");
    EXPECT_EQ(roundtrip("GET /files/t.bin HTTP/1.1\r\n\r\n"),
              "HTTP/1.1 200 OK\r\nContent-Type: application/octet-stream\r\nContent-Length: 4\r\n\r\ndata");
    EXPECT_EQ(roundtrip("GET / HTTP/1.1\r\n\r\n"), "HTTP/1.1 200 OK\r\n\r\n");

    srv.stop();
    loop.join();
}
