#include <catch2/catch_test_macros.hpp>

#include "infra/simulated_platform.hpp"
#include "network/node_topology.hpp"
#include "network/rpc_gateway.hpp"

#include <memory>

using namespace pgprobe::network;
using pgprobe::test::SimulatedPlatform;

namespace {

TransportResponse Http(int status, const std::string& body) {
    TransportResponse r;
    r.ok = true;
    r.http_status = status;
    r.body = body;
    return r;
}

struct GatewayFixture {
    std::shared_ptr<SimulatedPlatform> platform = std::make_shared<SimulatedPlatform>();
    std::unique_ptr<NodeTopology> topology;
    std::unique_ptr<RpcGateway> gateway;

    explicit GatewayFixture(RpcGateway::Config config = RpcGateway::Config{}) {
        config.retry_backoff = std::chrono::milliseconds(1);
        platform->AddNode("node1");
        platform->AddIdentity("alice", "node1");
        topology = std::make_unique<NodeTopology>(
            std::vector<NodeConfig>{{"node1", SimulatedPlatform::EndpointFor("node1")},
                                    {"node2", SimulatedPlatform::EndpointFor("node2")}},
            platform);
        topology->ConnectAll();
        gateway = std::make_unique<RpcGateway>(*topology, config);
    }

    GatewayResult Resolve(const std::string& name) {
        return gateway->Invoke("node1", "ptx_resolveVerifier",
                               nlohmann::json::array({name, "ecdsa:secp256k1", "eth_address"}));
    }
};

}  // namespace

TEST_CASE("RpcGateway: denial phrase table", "[gateway]") {
    REQUIRE(MatchDenialPhrase("PD011608 sender is NOT A MEMBER of privacy group") == "not a member");
    REQUIRE(MatchDenialPhrase("Forbidden") == "forbidden");
    REQUIRE(MatchDenialPhrase("error: ACCESS_DENIED") == "access_denied");
    REQUIRE(MatchDenialPhrase("Privacy group not found") == "privacy group not found");
    REQUIRE_FALSE(MatchDenialPhrase("execution reverted").has_value());
    REQUIRE_FALSE(MatchDenialPhrase("").has_value());
    REQUIRE(DenialPhrases().size() == 8);
}

TEST_CASE("RpcGateway: Classify keeps transport apart from rejection", "[gateway]") {
    GatewayFixture f;
    const auto& gw = *f.gateway;

    SECTION("Exchange never completed") {
        TransportResponse r;
        r.error = "connect failed: Connection refused";
        auto result = gw.Classify(r, 7);
        REQUIRE(result.IsTransport());
        REQUIRE(result.IsRetryable());
        REQUIRE(result.error().reason == "connect failed: Connection refused");
    }

    SECTION("Non-JSON error page") {
        auto result = gw.Classify(Http(502, "<html>Bad Gateway</html>"), 7);
        REQUIRE(result.IsTransport());
        REQUIRE(result.error().reason == "HTTP 502");
    }

    SECTION("Non-JSON body with 200") {
        auto result = gw.Classify(Http(200, "not json"), 7);
        REQUIRE(result.IsTransport());
        REQUIRE(result.error().reason == "malformed JSON-RPC response");
    }

    SECTION("Mismatched id") {
        auto result = gw.Classify(Http(200, R"({"jsonrpc":"2.0","id":8,"result":"0x1"})"), 7);
        REQUIRE(result.IsTransport());
    }

    SECTION("Neither result nor error") {
        auto result = gw.Classify(Http(200, R"({"jsonrpc":"2.0","id":7})"), 7);
        REQUIRE(result.IsTransport());
    }

    SECTION("Result") {
        auto result = gw.Classify(Http(200, R"({"jsonrpc":"2.0","id":7,"result":{"0":"42"}})"), 7);
        REQUIRE(result.IsOk());
        REQUIRE(result.value()["0"] == "42");
    }

    SECTION("Null result is a value") {
        auto result = gw.Classify(Http(200, R"({"jsonrpc":"2.0","id":7,"result":null})"), 7);
        REQUIRE(result.IsOk());
        REQUIRE(result.value().is_null());
    }

    SECTION("Free-text denial") {
        auto result = gw.Classify(
            Http(200, R"({"jsonrpc":"2.0","id":7,"error":{"code":-32603,"message":"sender is not a member"}})"), 7);
        REQUIRE(result.IsRejected());
        REQUIRE(result.error().pattern_matched);
        REQUIRE(result.error().code == -32603);
        REQUIRE_FALSE(result.IsRetryable());
    }

    SECTION("Unrecognised application error is unclassified, not a denial") {
        auto result = gw.Classify(
            Http(200, R"({"jsonrpc":"2.0","id":7,"error":{"code":-32603,"message":"execution reverted"}})"), 7);
        REQUIRE(result.IsTransport());
        REQUIRE(result.error().unclassified);
        REQUIRE_FALSE(result.IsRetryable());
    }

    SECTION("HTTP 500 carrying a JSON-RPC error is still classified") {
        auto result = gw.Classify(
            Http(500, R"({"jsonrpc":"2.0","id":7,"error":{"code":-32603,"message":"permission denied"}})"), 7);
        REQUIRE(result.IsRejected());
    }
}

TEST_CASE("RpcGateway: structured denial codes", "[gateway]") {
    RpcGateway::Config config;
    config.denial_codes = {SimulatedPlatform::kDenialCode};
    GatewayFixture f(config);

    auto by_code = f.gateway->ClassifyApplicationError("membership check failed", SimulatedPlatform::kDenialCode);
    REQUIRE(by_code.IsRejected());
    REQUIRE_FALSE(by_code.error().pattern_matched);

    auto other_code = f.gateway->ClassifyApplicationError("membership check failed", -32603);
    REQUIRE(other_code.IsTransport());
    REQUIRE(other_code.error().unclassified);

    auto empty = f.gateway->ClassifyApplicationError("", std::nullopt);
    REQUIRE(empty.IsTransport());
    REQUIRE(empty.error().reason == "application error without message");
}

TEST_CASE("RpcGateway: Invoke retries genuine transport faults only", "[gateway]") {
    GatewayFixture f;

    SECTION("One reset is absorbed by the retry") {
        f.platform->FailNext("node1", "ptx_resolveVerifier", 1);
        auto result = f.Resolve("alice");
        REQUIRE(result.IsOk());
        REQUIRE(result.attempts() == 2);
        REQUIRE(f.platform->CallCount("ptx_resolveVerifier") == 2);
    }

    SECTION("Persistent fault gives up after the bounded retries") {
        f.platform->FailNext("node1", "ptx_resolveVerifier", 5);
        auto result = f.Resolve("alice");
        REQUIRE(result.IsTransport());
        REQUIRE(result.attempts() == 2);
        REQUIRE(f.platform->CallCount("ptx_resolveVerifier") == 2);
    }

    SECTION("Malformed gateway page is retried") {
        f.platform->MalformedNext("node1", "ptx_resolveVerifier", 1);
        auto result = f.Resolve("alice");
        REQUIRE(result.IsOk());
        REQUIRE(result.attempts() == 2);
    }

    SECTION("Application errors are not retried") {
        auto result = f.Resolve("nobody");
        REQUIRE(result.IsTransport());
        REQUIRE(result.error().unclassified);
        REQUIRE(result.attempts() == 1);
        REQUIRE(f.platform->CallCount("ptx_resolveVerifier") == 1);
    }

    SECTION("Node without a connection") {
        auto result = f.gateway->Invoke("node2", "ptx_resolveVerifier", nlohmann::json::array());
        REQUIRE(result.IsTransport());
        REQUIRE(result.error().reason == "no connection to node node2");
        REQUIRE(f.platform->CallCount("ptx_resolveVerifier") == 0);
    }
}

TEST_CASE("RpcGateway: denials are final and never retried", "[gateway]") {
    auto call_unknown_group = [](GatewayFixture& f) {
        nlohmann::json call = {{"domain", "pente"}, {"group", "0xunknown"}, {"from", "alice"}, {"to", "0x01"}};
        return f.gateway->Invoke("node1", "pgroup_call", nlohmann::json::array({call}));
    };

    SECTION("Phrase-matched denial") {
        GatewayFixture f;
        auto result = call_unknown_group(f);
        REQUIRE(result.IsRejected());
        REQUIRE(result.error().pattern_matched);
        REQUIRE(result.attempts() == 1);
        REQUIRE(f.platform->CallCount("pgroup_call") == 1);
    }

    SECTION("Structured denial code") {
        RpcGateway::Config config;
        config.denial_codes = {SimulatedPlatform::kDenialCode};
        GatewayFixture f(config);
        f.platform->SetDenialStyle(SimulatedPlatform::DenialStyle::Structured);

        auto result = call_unknown_group(f);
        REQUIRE(result.IsRejected());
        REQUIRE_FALSE(result.error().pattern_matched);
        REQUIRE(result.error().code == SimulatedPlatform::kDenialCode);
        REQUIRE(result.attempts() == 1);
        REQUIRE(f.platform->CallCount("pgroup_call") == 1);
    }
}

TEST_CASE("RpcGateway: request envelope", "[gateway]") {
    GatewayFixture f;
    REQUIRE(f.Resolve("alice").IsOk());

    auto requests = f.platform->Requests("ptx_resolveVerifier");
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0] == nlohmann::json::array({"alice", "ecdsa:secp256k1", "eth_address"}));
}
