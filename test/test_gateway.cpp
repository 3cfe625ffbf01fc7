#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <chrono>
#include <string>

#include "gateway.hpp"
#include "ledger_fixture.hpp"

namespace {

httplib::Request request(const std::string &id, const std::string &body = "") {
    httplib::Request req;
    req.path_params["id"] = id;
    req.body = body;
    return req;
}

} // namespace

TEST_CASE("Status mapping") {
    CHECK(gateway::statusFor(UNEXPECTED_CODE::NOT_FOUND) == 404);
    CHECK(gateway::statusFor(UNEXPECTED_CODE::INVALID_INPUT) == 422);
    CHECK(gateway::statusFor(UNEXPECTED_CODE::LIMIT_EXCEEDED) == 422);
    CHECK(gateway::statusFor(UNEXPECTED_CODE::STORAGE_UNAVAILABLE) == 500);
}

TEST_CASE("Path and body parsing") {
    SUBCASE("Client identity") {
        CHECK(gateway::parseClientId("1") == 1);
        CHECK(gateway::parseClientId("42") == 42);
        CHECK_FALSE(gateway::parseClientId("0").has_value());
        CHECK_FALSE(gateway::parseClientId("-1").has_value());
        CHECK_FALSE(gateway::parseClientId("1a").has_value());
        CHECK_FALSE(gateway::parseClientId("abc").has_value());
        CHECK_FALSE(gateway::parseClientId("").has_value());
        CHECK_FALSE(gateway::parseClientId("99999999999999999999").has_value());
    }

    SUBCASE("Fields of the right type are kept") {
        auto input = gateway::parseTransactionInput(
            nlohmann::json::parse(R"({"value": 10, "type": "d", "description": "abc"})"));
        CHECK(input.value == 10);
        CHECK(input.type == "d");
        CHECK(input.description == "abc");
    }

    SUBCASE("Fields of the wrong type are dropped") {
        auto input = gateway::parseTransactionInput(
            nlohmann::json::parse(R"({"value": 1.5, "type": 1, "description": null})"));
        CHECK_FALSE(input.value.has_value());
        CHECK_FALSE(input.type.has_value());
        CHECK_FALSE(input.description.has_value());

        CHECK_FALSE(gateway::parseTransactionInput(nlohmann::json::parse(R"({"value": "10"})")).value.has_value());
        CHECK_FALSE(gateway::parseTransactionInput(nlohmann::json::parse(R"({"value": 18446744073709551615})")).value.has_value());
        CHECK_FALSE(gateway::parseTransactionInput(nlohmann::json::parse("[1, 2]")).value.has_value());
    }

    SUBCASE("Timestamps") {
        const models::Timestamp timestamp{std::chrono::milliseconds{1704110400123}};
        CHECK(gateway::formatTimestamp(timestamp) == "2024-01-01T12:00:00.123Z");
    }
}

TEST_CASE("HTTP handlers") {
    LedgerFixture db("gateway_handlers");
    const transactions::Processor processor{db.options, *db.table};
    const statement::Builder builder{db.options, *db.table};

    SUBCASE("Accepted transaction") {
        httplib::Response res;
        gateway::createTransaction(processor, request("1", R"({"value": 1, "type": "d", "description": "debit"})"), res);
        CHECK(res.status == 200);
        auto body = nlohmann::json::parse(res.body);
        CHECK(body["limit"] == 100000);
        CHECK(body["balance"] == -1);
    }

    SUBCASE("Overdraft is unprocessable and leaves the balance alone") {
        httplib::Response first;
        gateway::createTransaction(processor, request("1", R"({"value": 1, "type": "d", "description": "debit"})"), first);
        REQUIRE(first.status == 200);

        httplib::Response res;
        gateway::createTransaction(processor, request("1", R"({"value": 99999999, "type": "d", "description": "big"})"), res);
        CHECK(res.status == 422);
        CHECK(db.balanceOf(1) == -1);

        httplib::Response credit;
        gateway::createTransaction(processor, request("1", R"({"value": 1, "type": "c", "description": "credit"})"), credit);
        CHECK(credit.status == 200);
        CHECK(nlohmann::json::parse(credit.body)["balance"] == 0);
    }

    SUBCASE("Invalid bodies") {
        const char *bodies[] = {
            R"({"value": 1, "type": "d", "description": "01234567890"})",
            R"({"value": 1.2, "type": "d", "description": "frac"})",
            R"({"value": "1", "type": "d", "description": "text"})",
            R"({"value": 1, "type": "x", "description": "kind"})",
            R"({"value": 1, "type": "d", "description": ""})",
            R"({"value": 1, "type": "d", "description": null})",
            R"({"value": 1, "type": "d", "description": "ab\u0000c"})",
            R"({"value": 1, "type": "d", "description": "\u0000x"})",
            R"({"value": 0, "type": "c", "description": "zero"})",
            R"({"type": "c", "description": "none"})",
            R"({"value": 1, "type": "c")",
            "",
        };

        for (const char *body : bodies) {
            CAPTURE(body);
            httplib::Response res;
            gateway::createTransaction(processor, request("2", body), res);
            CHECK(res.status == 422);
            CHECK(res.body.empty());
            CHECK(res.get_header_value("Content-Type") == "text/html");
        }
        CHECK(db.balanceOf(2) == 0);
    }

    SUBCASE("Unknown clients") {
        for (const char *id : {"6", "0", "abc", "-3"}) {
            CAPTURE(id);
            httplib::Response post;
            gateway::createTransaction(processor, request(id, R"({"value": 1, "type": "c", "description": "x"})"), post);
            CHECK(post.status == 404);

            httplib::Response get;
            gateway::extract(builder, request(id), get);
            CHECK(get.status == 404);
        }
    }

    SUBCASE("Statement shape") {
        httplib::Response t1, t2;
        gateway::createTransaction(processor, request("3", R"({"value": 500, "type": "c", "description": "T1"})"), t1);
        gateway::createTransaction(processor, request("3", R"({"value": 200, "type": "d", "description": "T2"})"), t2);
        REQUIRE(t1.status == 200);
        REQUIRE(t2.status == 200);

        httplib::Response res;
        gateway::extract(builder, request("3"), res);
        REQUIRE(res.status == 200);

        auto body = nlohmann::json::parse(res.body);
        CHECK(body["balance"]["total"] == 300);
        CHECK(body["balance"]["limit"] == 1000000);
        CHECK(body["balance"]["date"].is_string());
        REQUIRE(body["latest_transactions"].size() == 2);
        CHECK(body["latest_transactions"][0]["value"] == 200);
        CHECK(body["latest_transactions"][0]["type"] == "d");
        CHECK(body["latest_transactions"][0]["description"] == "T2");
        CHECK(body["latest_transactions"][0]["executed_at"].get<std::string>().ends_with("Z"));
        CHECK(body["latest_transactions"][1]["description"] == "T1");
    }

    SUBCASE("Empty statement still lists an array") {
        httplib::Response res;
        gateway::extract(builder, request("5"), res);
        REQUIRE(res.status == 200);
        auto body = nlohmann::json::parse(res.body);
        CHECK(body["latest_transactions"].is_array());
        CHECK(body["latest_transactions"].empty());
    }

    SUBCASE("Health") {
        httplib::Response res;
        gateway::health(httplib::Request{}, res);
        CHECK(res.status == 200);
        CHECK(nlohmann::json::parse(res.body)["ok"] == true);
    }
}
