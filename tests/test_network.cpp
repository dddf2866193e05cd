#include <gtest/gtest.h>
#include "ghostpir/network/http.hpp"
#include "ghostpir/network/message.hpp"
#include "ghostpir/network/transport.hpp"
#include "ghostpir/pir/reconstructor.hpp"
#include "ghostpir/pir/vector_generator.hpp"
#include "ghostpir/retrieval/observer.hpp"
#include "test_support.hpp"
#include <chrono>
#include <thread>

using namespace ghostpir;
using namespace ghostpir::network;

// ============================================================================
// Wire Codec Tests
// ============================================================================

TEST(WireCodecTest, SessionMessages) {
    auto req = SessionRequestMessage::from_json(SessionRequestMessage{"abc123"}.to_json());
    EXPECT_EQ(req.ghost_id, "abc123");

    auto resp = SessionResponseMessage::from_json(R"({"token": "t-1", "expires_in": 60})");
    EXPECT_EQ(resp.token, "t-1");

    EXPECT_THROW(SessionResponseMessage::from_json(R"({"token": ""})"), ProtocolError);
    EXPECT_THROW(SessionResponseMessage::from_json("not json"), ProtocolError);
}

TEST(WireCodecTest, CatalogAcceptsNumericAndStringIds) {
    const std::string body = R"({
        "modules": [
            {"id": 101, "title": "Intro", "topic": "basics", "tier": 1,
             "chunk_count": 1, "compressed_size": 900},
            {"id": "adv-7", "title": "Advanced", "topic": "deep", "tier": 3,
             "chunk_count": 3, "compressed_size": 10000, "filename": "adv.pdf"}
        ]
    })";

    auto catalog = CatalogMessage::from_json(body).catalog;

    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog.at(0).id, "101");
    EXPECT_FALSE(catalog.at(0).filename.has_value());
    EXPECT_EQ(catalog.at(1).id, "adv-7");
    EXPECT_EQ(catalog.at(1).tier, 3);
    EXPECT_EQ(catalog.at(1).chunk_count, 3u);
    EXPECT_EQ(catalog.at(1).compressed_size, 10000u);
    ASSERT_TRUE(catalog.at(1).filename.has_value());
    EXPECT_EQ(*catalog.at(1).filename, "adv.pdf");
    EXPECT_EQ(catalog.position_of("adv-7").value_or(99), 1u);

    // Order survives re-encoding
    auto again = CatalogMessage::from_json(CatalogMessage{catalog}.to_json()).catalog;
    EXPECT_EQ(again.at(0).id, "101");
    EXPECT_EQ(again.at(1).id, "adv-7");
}

TEST(WireCodecTest, CatalogRejectsBadEntries) {
    EXPECT_THROW(CatalogMessage::from_json(R"({"modules": [{"id": 1.5}]})"), ProtocolError);
    EXPECT_THROW(CatalogMessage::from_json(R"({"modules": [{"id": true}]})"), ProtocolError);
    EXPECT_THROW(CatalogMessage::from_json(
                     R"({"modules": [{"id": 1, "chunk_count": -1, "compressed_size": 5}]})"),
                 ProtocolError);
}

TEST(WireCodecTest, KpirRequestCarriesThreeVectors) {
    pir::VectorGenerator gen;
    auto set = gen.generate(2, 5);

    KpirRequestMessage msg("tok", set, 4);
    auto json = msg.to_json();

    // The target index never leaves the client
    EXPECT_EQ(json.find("target"), std::string::npos);

    auto decoded = KpirRequestMessage::from_json(json, 5);
    EXPECT_EQ(decoded.token, "tok");
    EXPECT_EQ(decoded.chunk_index, 4u);
    for (size_t k = 0; k < kShareCount; ++k) {
        EXPECT_EQ(decoded.vectors[k], set[k]);
    }

    EXPECT_THROW(KpirRequestMessage::from_json(json, 6), ProtocolError);
}

TEST(WireCodecTest, KpirResponseValidation) {
    auto good = R"({"responses": [[1, 2], [3, 4], [255, 0]]})";
    auto resp = KpirResponseMessage::from_json(good, 2).response;
    EXPECT_EQ(resp.shares[2][0], 255);

    // Wrong share count
    EXPECT_THROW(KpirResponseMessage::from_json(R"({"responses": [[1, 2], [3, 4]]})", 2),
                 ProtocolError);
    // Wrong length
    EXPECT_THROW(KpirResponseMessage::from_json(good, 3), ProtocolError);
    // Out of byte range
    EXPECT_THROW(KpirResponseMessage::from_json(R"({"responses": [[1, 2], [3, 256], [0, 0]]})", 2),
                 ProtocolError);
    EXPECT_THROW(KpirResponseMessage::from_json(R"({"responses": [[1, 2], [3, -1], [0, 0]]})", 2),
                 ProtocolError);
    // Non-integer
    EXPECT_THROW(KpirResponseMessage::from_json(R"({"responses": [[1, 2], [3, 0.5], [0, 0]]})", 2),
                 ProtocolError);
    EXPECT_THROW(KpirResponseMessage::from_json(R"({"responses": [[1, 2], [3, "x"], [0, 0]]})", 2),
                 ProtocolError);
}

// ============================================================================
// HTTP Client Tests
// ============================================================================

namespace {

HttpRequest kpir_request(std::string body) {
    HttpRequest req;
    req.method = "POST";
    req.path = "/kpir";
    req.headers["Content-Type"] = "application/json";
    req.body = std::move(body);
    return req;
}

HttpResponse text_response(int status, std::string body) {
    HttpResponse resp;
    resp.status = status;
    resp.body = std::move(body);
    return resp;
}

} // anonymous namespace

TEST(HttpClientTest, ContentLengthExchange) {
    test_support::LoopbackHttpServer server([](const HttpRequest& req) {
        HttpResponse resp = text_response(200, req.method + " " + req.path + " " +
                                                   req.headers.at("content-type") + " " + req.body);
        resp.reason = "OK";
        resp.headers["X-Host"] = req.headers.at("host");
        resp.headers["X-Connection"] = req.headers.at("connection");
        return resp;
    });

    HttpClient client(Endpoint::parse(server.base_url()), std::chrono::seconds(5));
    auto resp = client.send(kpir_request("{\"token\":\"t\"}"));

    EXPECT_TRUE(resp.ok());
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.reason, "OK");
    EXPECT_EQ(resp.body, "POST /kpir application/json {\"token\":\"t\"}");
    EXPECT_EQ(resp.headers.at("x-host"), "127.0.0.1:" + std::to_string(server.port()));
    EXPECT_EQ(resp.headers.at("x-connection"), "close");
    EXPECT_EQ(resp.headers.at("content-length"), std::to_string(resp.body.size()));

    EXPECT_GT(client.bytes_sent(), 0u);
    EXPECT_GT(client.bytes_received(), resp.body.size());
    EXPECT_EQ(server.served(), 1u);
}

TEST(HttpClientTest, ChunkedResponse) {
    test_support::LoopbackHttpServer server(
        [](const HttpRequest&) { return text_response(200, "Wikipedia"); },
        test_support::LoopbackHttpServer::Framing::Chunked);

    HttpClient client(Endpoint::parse(server.base_url()), std::chrono::seconds(5));
    auto resp = client.send(kpir_request("{}"));

    EXPECT_EQ(resp.headers.at("transfer-encoding"), "chunked");
    EXPECT_EQ(resp.body, "Wikipedia");
}

TEST(HttpClientTest, BodyReadToEof) {
    test_support::LoopbackHttpServer server(test_support::LoopbackHttpServer::RawReply{
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n{\"a\":1}"});

    HttpClient client(Endpoint::parse(server.base_url()), std::chrono::seconds(5));
    auto resp = client.send(kpir_request("{}"));

    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "{\"a\":1}");
}

TEST(HttpClientTest, NonSuccessStatusIsReturned) {
    test_support::LoopbackHttpServer server(
        [](const HttpRequest&) { return text_response(404, "{}"); });

    HttpClient client(Endpoint::parse(server.base_url()), std::chrono::seconds(5));
    auto resp = client.send(kpir_request("{}"));

    EXPECT_FALSE(resp.ok());
    EXPECT_EQ(resp.status, 404);
}

TEST(HttpClientTest, MalformedResponses) {
    {
        test_support::LoopbackHttpServer server(
            test_support::LoopbackHttpServer::RawReply{"garbage\r\n\r\n"});
        HttpClient client(Endpoint::parse(server.base_url()), std::chrono::seconds(5));
        EXPECT_THROW(client.send(kpir_request("{}")), ReceiveError);
    }
    {
        test_support::LoopbackHttpServer server(
            test_support::LoopbackHttpServer::RawReply{"HTTP/1.1 2x0 OK\r\n\r\n"});
        HttpClient client(Endpoint::parse(server.base_url()), std::chrono::seconds(5));
        EXPECT_THROW(client.send(kpir_request("{}")), ReceiveError);
    }
    {
        // Content-Length promises more than arrives before EOF
        test_support::LoopbackHttpServer server(test_support::LoopbackHttpServer::RawReply{
            "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel"});
        HttpClient client(Endpoint::parse(server.base_url()), std::chrono::seconds(5));
        EXPECT_THROW(client.send(kpir_request("{}")), ReceiveError);
    }
}

TEST(HttpClientTest, SilentServerHitsDeadline) {
    test_support::LoopbackHttpServer server([](const HttpRequest&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        return text_response(200, "{}");
    });

    HttpClient client(Endpoint::parse(server.base_url()), std::chrono::milliseconds(200));
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.send(kpir_request("{}")), ReceiveError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1200));
}

TEST(HttpClientTest, UnknownMethodRejectedBeforeConnecting) {
    HttpClient client(Endpoint{"127.0.0.1", 1}, std::chrono::seconds(1));
    HttpRequest req = kpir_request("{}");
    req.method = "BREW";

    EXPECT_THROW(client.send(req), SendError);
    EXPECT_EQ(client.bytes_sent(), 0u);
}

// ============================================================================
// Loopback Transport Tests
// ============================================================================

namespace {

HttpResponse json_response(int status, std::string body) {
    HttpResponse resp;
    resp.status = status;
    resp.reason = status == 200 ? "OK" : "Error";
    resp.headers["Content-Type"] = "application/json";
    resp.body = std::move(body);
    return resp;
}

/// HTTP front for an InMemoryPirServer using the production codecs
test_support::LoopbackHttpServer::Handler make_handler(std::shared_ptr<test_support::InMemoryPirServer> backend) {
    return [backend](const HttpRequest& req) -> HttpResponse {
        try {
            if (req.method == "POST" && req.path == "/session") {
                auto msg = SessionRequestMessage::from_json(req.body);
                return json_response(200, SessionResponseMessage{backend->create_session(msg.ghost_id)}.to_json());
            }
            if (req.method == "GET" && req.path == "/catalog") {
                return json_response(200, CatalogMessage{backend->fetch_catalog()}.to_json());
            }
            if (req.method == "POST" && req.path == "/kpir") {
                auto msg = KpirRequestMessage::from_json(req.body);
                QueryVectorSet set(msg.vectors, 0);
                auto response = backend->query(msg.token, std::move(set), msg.chunk_index);
                return json_response(200, KpirResponseMessage{response}.to_json());
            }
            return json_response(404, "{}");
        } catch (const NetworkError& e) {
            return json_response(e.status(), "{}");
        } catch (const ProtocolError&) {
            return json_response(400, "{}");
        }
    };
}

} // anonymous namespace

class LoopbackTransportTest : public ::testing::Test {
protected:
    static constexpr size_t kChunkSize = 64;

    void SetUp() override {
        backend_ = std::make_shared<test_support::InMemoryPirServer>(kChunkSize);
        payload_ = test_support::jpeg_payload(150, 21);
        stream_ = test_support::gzip(payload_);
        for (int i = 0; i < 4; ++i) {
            backend_->add_module(std::to_string(100 + i), test_support::random_bytes(100, i));
        }
        backend_->add_module("104", stream_);

        server_ = std::make_unique<test_support::LoopbackHttpServer>(make_handler(backend_));

        config_.base_url = server_->base_url();
        config_.chunk_size = kChunkSize;
        config_.io_timeout = std::chrono::seconds(5);
        traffic_ = std::make_shared<retrieval::TrafficObserver>();
    }

    std::shared_ptr<test_support::InMemoryPirServer> backend_;
    std::unique_ptr<test_support::LoopbackHttpServer> server_;
    std::vector<uint8_t> payload_;
    std::vector<uint8_t> stream_;
    ClientConfig config_;
    std::shared_ptr<retrieval::TrafficObserver> traffic_;
};

TEST_F(LoopbackTransportTest, SessionCatalogAndQuery) {
    HttpPirTransport transport(config_, traffic_);

    auto token = transport.create_session("ghost");
    EXPECT_EQ(token, "token-1");

    auto catalog = transport.fetch_catalog();
    ASSERT_EQ(catalog.size(), 5u);
    auto pos = catalog.position_of("104");
    ASSERT_TRUE(pos.has_value());

    pir::VectorGenerator gen;
    pir::Reconstructor rec(kChunkSize);

    std::vector<uint8_t> recovered;
    for (size_t c = 0; c < catalog.at(*pos).chunk_count; ++c) {
        auto chunk = rec.recover(transport.query(token, gen.generate(*pos, catalog.size()), c));
        recovered.insert(recovered.end(), chunk.begin(), chunk.end());
    }
    recovered.resize(stream_.size());
    EXPECT_EQ(recovered, stream_);

    auto totals = traffic_->overall();
    EXPECT_EQ(totals.count, 2u + catalog.at(*pos).chunk_count);
    EXPECT_GT(totals.request_bytes, 0u);
    EXPECT_GT(totals.response_bytes, 0u);
    EXPECT_EQ(traffic_->for_category(retrieval::TrafficCategory::Auth).count, 1u);
    EXPECT_EQ(traffic_->for_category(retrieval::TrafficCategory::Catalog).count, 1u);
    EXPECT_EQ(traffic_->for_category(retrieval::TrafficCategory::PIR).count,
              catalog.at(*pos).chunk_count);
    ASSERT_TRUE(traffic_->last_event().has_value());
    EXPECT_EQ(traffic_->last_event()->path, "/kpir");
}

TEST_F(LoopbackTransportTest, RejectedTokenIsSessionExpired) {
    HttpPirTransport transport(config_);
    backend_->revoke("stale");

    pir::VectorGenerator gen;
    try {
        transport.query("stale", gen.generate(0, 5), 1);
        FAIL() << "expected SessionExpired";
    } catch (const SessionExpired& e) {
        EXPECT_EQ(e.status(), 401);
        EXPECT_EQ(e.endpoint(), "/kpir");
        EXPECT_EQ(e.chunk_index().value_or(99), 1u);
    }
}

TEST_F(LoopbackTransportTest, ServerErrorIsHttpError) {
    HttpPirTransport transport(config_);
    backend_->fail_chunk_once(0, 503);

    pir::VectorGenerator gen;
    try {
        transport.query("token", gen.generate(0, 5), 0);
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.status(), 503);
        EXPECT_EQ(e.chunk_index().value_or(99), 0u);
    }
}

TEST_F(LoopbackTransportTest, WrongVectorLengthRejected) {
    HttpPirTransport transport(config_);
    pir::VectorGenerator gen;

    EXPECT_THROW(transport.query("token", gen.generate(0, 3), 0), HttpError);
}

TEST(TransportTest, UnreachableHostIsConnectionError) {
    uint16_t port = 0;
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor acceptor(
            ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        port = acceptor.local_endpoint().port();
    }

    ClientConfig config;
    config.base_url = "http://127.0.0.1:" + std::to_string(port);
    config.io_timeout = std::chrono::seconds(2);
    HttpPirTransport transport(config);

    try {
        transport.fetch_catalog();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.endpoint(), "/catalog");
        EXPECT_EQ(e.status(), 0);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
