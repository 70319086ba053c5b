/**
 * @file QuoteHandlerTest.cpp
 * @brief Unit-тесты для QuoteHandler
 *
 * list, show, new, set, delete
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/QuoteHandler.hpp"
#include "mocks/MockQuoteService.hpp"

using namespace quotedesk;
using namespace quotedesk::adapters::primary;
using namespace quotedesk::tests;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class QuoteHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockService_ = std::make_shared<MockQuoteService>();
        handler_ = std::make_unique<QuoteHandler>(
            mockService_,
            std::make_shared<settings::QuoteSettings>("ARCS"),
            std::make_shared<settings::ExportSettings>());
    }

    static domain::Quote createTestQuote(const std::string& id, const std::string& name) {
        domain::Quote quote(id, name);
        quote.createdAt = domain::Timestamp::fromString("2025-05-06T07:08:09Z");
        quote.modifiedAt = quote.createdAt;
        quote.items.push_back(domain::LineItem("A-1", "Bolt", 4,
            domain::Money::fromDouble(0.5), domain::Money::fromDouble(1.25), "Acme"));
        return quote;
    }

    CommandResponse run(const std::vector<std::string>& tokens) {
        CommandResponse res;
        handler_->handle(CommandRequest::parse(tokens), res);
        return res;
    }

    std::shared_ptr<MockQuoteService> mockService_;
    std::unique_ptr<QuoteHandler> handler_;
};

// ============================================================================
// list / show
// ============================================================================

TEST_F(QuoteHandlerTest, List_PrintsQuotesWithTotals) {
    EXPECT_CALL(*mockService_, listQuotes())
        .WillOnce(Return(std::vector<domain::Quote>{createTestQuote("1", "First"), createTestQuote("2", "Second")}));

    auto res = run({"list"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_THAT(res.getOutput(), HasSubstr("First"));
    EXPECT_THAT(res.getOutput(), HasSubstr("Second"));
    EXPECT_THAT(res.getOutput(), HasSubstr("$5.00"));
}

TEST_F(QuoteHandlerTest, List_Empty) {
    EXPECT_CALL(*mockService_, listQuotes()).WillOnce(Return(std::vector<domain::Quote>{}));

    auto res = run({"list"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_THAT(res.getOutput(), HasSubstr("No quotes saved."));
}

TEST_F(QuoteHandlerTest, Show_PrintsItemsAndMargin) {
    auto quote = createTestQuote("1", "First");
    quote.poNumber = "PO-9";
    EXPECT_CALL(*mockService_, findQuote("1")).WillOnce(Return(quote));

    auto res = run({"show", "1"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_THAT(res.getOutput(), HasSubstr("PO:       PO-9"));
    EXPECT_THAT(res.getOutput(), HasSubstr("Bolt"));
    EXPECT_THAT(res.getOutput(), HasSubstr("60.0%"));
    EXPECT_THAT(res.getOutput(), HasSubstr("Total: $5.00"));
}

TEST_F(QuoteHandlerTest, Show_UnknownId_ExitInvalid) {
    EXPECT_CALL(*mockService_, findQuote("9")).WillOnce(Return(std::nullopt));

    auto res = run({"show", "9"});

    EXPECT_EQ(res.getExitCode(), EXIT_INVALID);
    EXPECT_THAT(res.getError(), HasSubstr("Error: Quote not found: 9"));
}

TEST_F(QuoteHandlerTest, Show_MissingId_ExitInvalid) {
    auto res = run({"show"});
    EXPECT_EQ(res.getExitCode(), EXIT_INVALID);
}

// ============================================================================
// new / set / delete
// ============================================================================

TEST_F(QuoteHandlerTest, New_WithPo_RenamesAndSaves) {
    domain::Quote created("77", "ARCS 2025-05-06");
    created.createdAt = domain::Timestamp::fromString("2025-05-06T00:00:00Z");

    EXPECT_CALL(*mockService_, createQuote(std::optional<std::string>()))
        .WillOnce(Return(created));
    EXPECT_CALL(*mockService_, saveQuote(::testing::Truly([](const domain::Quote& q) {
        return q.id == "77" && q.name == "ARCS 2025-05-06 [PO:P-1]" && q.notes == "rush";
    })));

    auto res = run({"new", "--po", "P-1", "--notes", "rush"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_THAT(res.getOutput(), HasSubstr("Created quote 77"));
}

TEST_F(QuoteHandlerTest, New_ExplicitNameKept) {
    domain::Quote created("78", "Custom");
    EXPECT_CALL(*mockService_, createQuote(std::optional<std::string>("Custom")))
        .WillOnce(Return(created));
    EXPECT_CALL(*mockService_, saveQuote(::testing::Truly([](const domain::Quote& q) {
        return q.name == "Custom";
    })));

    auto res = run({"new", "--name", "Custom", "--po", "P-2"});
    EXPECT_EQ(res.getExitCode(), EXIT_OK);
}

TEST_F(QuoteHandlerTest, New_SaveFails_ExitIoError) {
    EXPECT_CALL(*mockService_, createQuote(_)).WillOnce(Return(domain::Quote("1", "Q")));
    EXPECT_CALL(*mockService_, saveQuote(_))
        .WillOnce(Throw(domain::FileSystemError("Permission denied")));

    auto res = run({"new"});

    EXPECT_EQ(res.getExitCode(), EXIT_IO_ERROR);
    EXPECT_THAT(res.getError(), HasSubstr("Permission denied"));
}

TEST_F(QuoteHandlerTest, Set_UpdatesHeader) {
    EXPECT_CALL(*mockService_, updateHeader("5", std::optional<std::string>("PO-5"), std::optional<std::string>()))
        .WillOnce(Return(domain::Quote("5", "Five")));

    auto res = run({"set", "5", "--po", "PO-5"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_THAT(res.getOutput(), HasSubstr("Updated quote 5"));
}

TEST_F(QuoteHandlerTest, Set_NothingToUpdate) {
    EXPECT_CALL(*mockService_, updateHeader(_, _, _)).Times(0);

    auto res = run({"set", "5"});

    EXPECT_EQ(res.getExitCode(), EXIT_INVALID);
}

TEST_F(QuoteHandlerTest, Delete_Existing) {
    EXPECT_CALL(*mockService_, deleteQuote("3")).WillOnce(Return(true));

    auto res = run({"delete", "3"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_THAT(res.getOutput(), HasSubstr("Deleted quote 3"));
}

TEST_F(QuoteHandlerTest, Delete_Unknown) {
    EXPECT_CALL(*mockService_, deleteQuote("3")).WillOnce(Return(false));

    auto res = run({"delete", "3"});

    EXPECT_EQ(res.getExitCode(), EXIT_INVALID);
}
