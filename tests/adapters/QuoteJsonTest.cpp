/**
 * @file QuoteJsonTest.cpp
 * @brief Unit-тесты маппинга Quote <-> JSON
 */

#include <gtest/gtest.h>
#include "adapters/secondary/json/QuoteJson.hpp"

using namespace quotedesk;
using namespace quotedesk::adapters::secondary;

TEST(QuoteJsonTest, ToJson_WritesAllKeys) {
    domain::Quote quote("1700000000", "ARCS 2023-11-14 [PO:77]");
    quote.poNumber = "77";
    quote.notes = "Deliver Friday";
    quote.items.push_back(domain::LineItem("P-1", "Pump", 3,
        domain::Money::fromDouble(10.0), domain::Money::fromDouble(12.5), "Acme"));
    quote.suppliers["Acme"] = domain::SupplierSettings{true};

    auto j = QuoteJson::toJson(quote);

    EXPECT_EQ(j["id"], "1700000000");
    EXPECT_EQ(j["po_number"], "77");
    EXPECT_EQ(j["notes"], "Deliver Friday");
    ASSERT_EQ(j["items"].size(), 1u);
    EXPECT_EQ(j["items"][0]["part_number"], "P-1");
    EXPECT_EQ(j["items"][0]["quantity"], 3);
    EXPECT_NEAR(j["items"][0]["line_total"].get<double>(), 37.5, 1e-9);
    EXPECT_EQ(j["suppliers"]["Acme"]["tax_exempt"], true);
}

TEST(QuoteJsonTest, ToJson_OmitsUnsetPo) {
    domain::Quote quote("1", "Q");
    auto j = QuoteJson::toJson(quote);
    EXPECT_FALSE(j.contains("po_number"));
}

TEST(QuoteJsonTest, FromJson_LegacyRecord) {
    auto j = nlohmann::json::parse(R"({
        "id": 1700000000,
        "name": "ARCS 2023-11-14",
        "po_number": "",
        "created_at": "2023-11-14T22:13:20.123456",
        "items": [
            {"part_number": "A", "description": "x", "quantity": 2,
             "unit_cost": 1.5, "list_price": 2, "source": "S", "line_total": 999.0}
        ]
    })");

    auto quote = QuoteJson::fromJson(j);

    EXPECT_EQ(quote.id, "1700000000");
    EXPECT_FALSE(quote.poNumber.has_value());
    EXPECT_EQ(quote.createdAt.toString(), "2023-11-14T22:13:20Z");
    EXPECT_EQ(quote.modifiedAt, quote.createdAt);
    ASSERT_EQ(quote.items.size(), 1u);
    // Сохранённый line_total не используется
    EXPECT_EQ(quote.totalPrice().toString(), "4.00");
    EXPECT_TRUE(quote.suppliers.empty());
}

TEST(QuoteJsonTest, FromJson_MissingItemFieldsDefault) {
    auto j = nlohmann::json::parse(R"({"id": "q", "items": [{}]})");

    auto quote = QuoteJson::fromJson(j);

    ASSERT_EQ(quote.items.size(), 1u);
    EXPECT_EQ(quote.items[0].quantity, 0);
    EXPECT_TRUE(quote.items[0].listPrice.isZero());
    EXPECT_EQ(quote.items[0].partNumber, "");
}

TEST(QuoteJsonTest, FromJson_RoundTrip) {
    domain::Quote quote("42", "Round trip");
    quote.poNumber = "PO";
    quote.notes = "multi\nline";
    quote.items.push_back(domain::LineItem("P", "D", 7,
        domain::Money::fromDouble(0.1), domain::Money::fromDouble(0.35), ""));
    quote.suppliers[domain::UNKNOWN_SUPPLIER] = domain::SupplierSettings{false};

    auto restored = QuoteJson::fromJson(QuoteJson::toJson(quote));

    EXPECT_EQ(restored, quote);
}

TEST(QuoteJsonTest, FromJson_InvalidShapes_ThrowParseError) {
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::array()), domain::ParseError);
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::parse(R"({"name": "no id"})")), domain::ParseError);
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::parse(R"({"id": "1", "items": 5})")), domain::ParseError);
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::parse(R"({"id": "1", "items": [{"quantity": "many"}]})")),
                 domain::ParseError);
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::parse(R"({"id": "1", "created_at": "soon"})")),
                 domain::ParseError);
}

TEST(QuoteJsonTest, FromJson_NegativeQuantity_ThrowsParseError) {
    auto j = nlohmann::json::parse(R"({"id": "1", "items": [{"part_number": "A", "quantity": -5}]})");

    EXPECT_THROW(QuoteJson::fromJson(j), domain::ParseError);
}

TEST(QuoteJsonTest, FromJson_FractionalQuantity_ThrowsParseError) {
    auto fractional = nlohmann::json::parse(R"({"id": "1", "items": [{"quantity": 2.7}]})");
    auto whole = nlohmann::json::parse(R"({"id": "1", "items": [{"quantity": 3.0}]})");

    EXPECT_THROW(QuoteJson::fromJson(fractional), domain::ParseError);
    EXPECT_EQ(QuoteJson::fromJson(whole).items.at(0).quantity, 3);
}

TEST(QuoteJsonTest, FromJson_PriceOutOfRange_ThrowsParseError) {
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::parse(
                     R"({"id": "1", "items": [{"quantity": 1, "list_price": -3}]})")),
                 domain::ParseError);
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::parse(
                     R"({"id": "1", "items": [{"quantity": 1, "unit_cost": 1e300}]})")),
                 domain::ParseError);
    EXPECT_THROW(QuoteJson::fromJson(nlohmann::json::parse(
                     R"({"id": "1", "items": [{"quantity": 99999999999}]})")),
                 domain::ParseError);
}

TEST(QuoteJsonTest, ListFromJson_RequiresArray) {
    EXPECT_THROW(QuoteJson::listFromJson(nlohmann::json::object()), domain::ParseError);
    EXPECT_TRUE(QuoteJson::listFromJson(nlohmann::json::array()).empty());
}
