#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <boost/asio.hpp>
#include <boost/lexical_cast.hpp>

#include <dockhand/client.hpp>
#include <dockhand/containers.hpp>
#include <dockhand/errors.hpp>
#include <dockhand/http.hpp>
#include <dockhand/transport.hpp>

#include "mock.hpp"

using namespace dockhand;
using namespace dockhand::test;

using namespace ::testing;

namespace {

const std::string listing =
    R"([{"Id":"8dfafdbc3a40","Names":["/boring_feynman"],"Image":"ubuntu:latest",)"
    R"("ImageID":"d74508fb6632","Command":"echo 1","Created":1367854155,"State":"exited",)"
    R"("Status":"Exit 0","Ports":[],"SizeRw":12288,"SizeRootFs":0,)"
    R"("HostConfig":{"NetworkMode":"default"},"Mounts":[]}])";

// Splits the body into chunks of at most `size` bytes.
std::string
chunked(const std::string& body, size_t size) {
    std::string result;

    for(size_t offset = 0; offset < body.size(); offset += size) {
        const std::string chunk = body.substr(offset, size);

        std::ostringstream length;
        length << std::hex << chunk.size();

        result += length.str() + "\r\n" + chunk + "\r\n";
    }

    return result + "0\r\n\r\n";
}

std::string
chunked_reply(const std::string& body, size_t size) {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: application/json\r\n"
           "Transfer-Encoding: chunked\r\n"
           "\r\n" + chunked(body, size);
}

// Serves exactly one connection on a unix socket: reads the request head, answers with a canned
// reply and closes. An empty reply closes the connection without writing anything.
class daemon_stub_t {
public:
    explicit
    daemon_stub_t(const std::string& reply) :
        m_path("/tmp/dockhand-test-" + boost::lexical_cast<std::string>(::getpid()) + ".sock"),
        m_reply(reply)
    {
        ::unlink(m_path.c_str());

        m_acceptor.reset(new boost::asio::local::stream_protocol::acceptor(
            m_ioservice,
            boost::asio::local::stream_protocol::endpoint(m_path)
        ));

        m_thread = std::thread([this] { serve(); });
    }

   ~daemon_stub_t() {
        if(m_thread.joinable()) {
            m_thread.join();
        }

        ::unlink(m_path.c_str());
    }

    std::string
    endpoint() const {
        return "unix://" + m_path;
    }

    // Waits for the served connection to finish and returns what the client sent.
    const std::string&
    received() {
        m_thread.join();
        return m_received;
    }

private:
    void
    serve() {
        boost::asio::local::stream_protocol::socket socket(m_ioservice);
        boost::system::error_code error;

        m_acceptor->accept(socket, error);

        if(error) {
            return;
        }

        boost::asio::streambuf buffer;
        boost::asio::read_until(socket, buffer, "\r\n\r\n", error);

        m_received.assign(boost::asio::buffers_begin(buffer.data()),
                          boost::asio::buffers_end(buffer.data()));

        if(!m_reply.empty()) {
            boost::asio::write(socket, boost::asio::buffer(m_reply), error);
        }

        socket.close(error);
    }

private:
    const std::string m_path;
    const std::string m_reply;

    boost::asio::io_service m_ioservice;
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> m_acceptor;

    std::string m_received;
    std::thread m_thread;
};

}  // namespace

TEST(dechunk, PlainReplyIsUntouched) {
    const std::string raw = *reply("[]");

    auto result = dechunk(raw);

    ASSERT_TRUE(result);
    EXPECT_EQ(raw, *result);
}

TEST(dechunk, ReassemblesBody) {
    auto result = dechunk(chunked_reply(listing, 16));

    ASSERT_TRUE(result);

    auto response = http::parse_response(*result);

    ASSERT_TRUE(response);
    EXPECT_EQ(listing, response.value().body());
    EXPECT_EQ(boost::lexical_cast<std::string>(listing.size()),
              *response.value().headers().header("Content-Length"));
    EXPECT_FALSE(response.value().headers().header("Transfer-Encoding"));
    EXPECT_EQ("application/json", *response.value().headers().header("Content-Type"));
}

TEST(dechunk, AcceptsExtensionsTrailersAndUppercaseHex) {
    const std::string raw = "HTTP/1.1 200 OK\r\n"
                            "transfer-encoding: gzip, Chunked\r\n"
                            "\r\n"
                            "A;name=value\r\n"
                            "0123456789\r\n"
                            "0\r\n"
                            "X-Trailer: yes\r\n"
                            "\r\n";

    auto result = dechunk(raw);

    ASSERT_TRUE(result);
    EXPECT_EQ("0123456789", http::extract_body(*result));
}

TEST(dechunk, BrokenFraming) {
    EXPECT_FALSE(dechunk("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nabc\r\n0\r\n\r\n"));
    EXPECT_FALSE(dechunk("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n10\r\nabc\r\n0\r\n\r\n"));
    EXPECT_FALSE(dechunk("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc"));
    EXPECT_FALSE(dechunk("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nffffffffffffffffffff\r\n"));
}

TEST(socket_transport_t, SendsRequestAndReturnsReply) {
    const std::string answer = *reply(listing);

    daemon_stub_t daemon(answer);
    socket_transport_t transport(endpoint_t::from_string(daemon.endpoint()), null_logger());

    auto request = http::format_request("/containers/json?all=true&size=true", "GET", "");
    ASSERT_TRUE(request);

    auto raw = transport.send(request.value());

    EXPECT_EQ(request.value(), daemon.received());
    ASSERT_TRUE(raw);
    EXPECT_EQ(answer, *raw);
}

TEST(socket_transport_t, ReassemblesChunkedReply) {
    daemon_stub_t daemon(chunked_reply(listing, 32));
    socket_transport_t transport(endpoint_t::from_string(daemon.endpoint()), null_logger());

    auto raw = transport.send(http::format_request("/containers/json?all=true&size=true", "GET", "").value());

    ASSERT_TRUE(raw);

    auto containers = containers_t::decode_list(http::extract_body(*raw));

    ASSERT_TRUE(containers);
    ASSERT_EQ(1u, containers.value().size());
    EXPECT_EQ("8dfafdbc3a40", containers.value()[0].id);
    EXPECT_EQ("default", containers.value()[0].network_mode);
}

TEST(socket_transport_t, ClosedWithoutReplyIsNoResponse) {
    daemon_stub_t daemon("");
    socket_transport_t transport(endpoint_t::from_string(daemon.endpoint()), null_logger());

    EXPECT_FALSE(transport.send(http::format_request("/_ping", "GET", "").value()));
}

TEST(client_t, ListsContainersFromChunkedDaemon) {
    daemon_stub_t daemon(chunked_reply(listing, 7));

    config_t config;
    config.endpoint = daemon.endpoint();

    client_t client(config, null_logger());

    auto result = client.containers().list_all();

    ASSERT_TRUE(result);
    ASSERT_EQ(1u, result.value().size());
    EXPECT_EQ("ubuntu:latest", result.value()[0].image);
}

TEST(client_t, DaemonClosingWithoutReplyIsNoResponse) {
    daemon_stub_t daemon("");

    config_t config;
    config.endpoint = daemon.endpoint();

    client_t client(config, null_logger());

    auto result = client.system().ping();

    ASSERT_FALSE(result);
    EXPECT_EQ(error::make_error_code(error::no_response), result.error());
}
