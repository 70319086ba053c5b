/**
 * @file LineItemHandlerTest.cpp
 * @brief Unit-тесты для LineItemHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/LineItemHandler.hpp"
#include "mocks/MockQuoteService.hpp"

using namespace quotedesk;
using namespace quotedesk::adapters::primary;
using namespace quotedesk::tests;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::DoAll;
using ::testing::Throw;

class LineItemHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockService_ = std::make_shared<MockQuoteService>();
        handler_ = std::make_unique<LineItemHandler>(mockService_);
    }

    static domain::Quote quoteWithItems(size_t count) {
        domain::Quote quote("1", "Q");
        for (size_t i = 0; i < count; ++i) {
            quote.items.push_back(domain::LineItem("P" + std::to_string(i), "D", 2,
                domain::Money(1, 123456789), domain::Money::fromDouble(2.0), "Acme"));
        }
        return quote;
    }

    CommandResponse run(const std::vector<std::string>& tokens) {
        CommandResponse res;
        handler_->handle(CommandRequest::parse(tokens), res);
        return res;
    }

    std::shared_ptr<MockQuoteService> mockService_;
    std::unique_ptr<LineItemHandler> handler_;
};

TEST_F(LineItemHandlerTest, AddItem_PassesRawFields) {
    domain::LineItemInput captured;
    EXPECT_CALL(*mockService_, addLineItem("1", _))
        .WillOnce(DoAll(SaveArg<1>(&captured), Return(quoteWithItems(1))));

    auto res = run({"add-item", "1", "--part", "A-1", "--desc", "Bolt", "--qty", "4",
                    "--cost", "0.50", "--list", "$1.25", "--source", "Acme"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_EQ(captured.partNumber, "A-1");
    EXPECT_EQ(captured.description, "Bolt");
    EXPECT_EQ(captured.quantity, "4");
    EXPECT_EQ(captured.unitCost, "0.50");
    EXPECT_EQ(captured.listPrice, "$1.25");
    EXPECT_EQ(captured.source, "Acme");
    EXPECT_THAT(res.getOutput(), HasSubstr("Added line item 1 to quote 1"));
}

TEST_F(LineItemHandlerTest, AddItem_ValidationError_ExitInvalid) {
    EXPECT_CALL(*mockService_, addLineItem("1", _))
        .WillOnce(Throw(domain::ValidationError("Quantity must be a non-negative whole number: '-2'")));

    auto res = run({"add-item", "1", "--qty", "-2"});

    EXPECT_EQ(res.getExitCode(), EXIT_INVALID);
    EXPECT_THAT(res.getError(), HasSubstr("Quantity"));
}

TEST_F(LineItemHandlerTest, EditItem_OneBasedAndKeepsOtherFields) {
    auto quote = quoteWithItems(2);
    EXPECT_CALL(*mockService_, findQuote("1")).WillOnce(Return(quote));

    domain::LineItemInput captured;
    EXPECT_CALL(*mockService_, editLineItem("1", 1u, _))
        .WillOnce(DoAll(SaveArg<2>(&captured), Return(quote)));

    auto res = run({"edit-item", "1", "2", "--qty", "9"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_EQ(captured.partNumber, "P1");
    EXPECT_EQ(captured.quantity, "9");
    EXPECT_EQ(captured.unitCost, "1.123456789");
    EXPECT_EQ(captured.source, "Acme");
}

TEST_F(LineItemHandlerTest, EditItem_OutOfRange_ExitInvalid) {
    EXPECT_CALL(*mockService_, findQuote("1")).WillOnce(Return(quoteWithItems(1)));
    EXPECT_CALL(*mockService_, editLineItem(_, _, _)).Times(0);

    auto res = run({"edit-item", "1", "3", "--qty", "9"});

    EXPECT_EQ(res.getExitCode(), EXIT_INVALID);
}

TEST_F(LineItemHandlerTest, RemoveItem_ConvertsIndex) {
    EXPECT_CALL(*mockService_, removeLineItem("1", 0u)).WillOnce(Return(quoteWithItems(0)));

    auto res = run({"remove-item", "1", "1"});

    EXPECT_EQ(res.getExitCode(), EXIT_OK);
    EXPECT_THAT(res.getOutput(), HasSubstr("Removed line item 1"));
}

TEST_F(LineItemHandlerTest, RemoveItem_ZeroOrGarbageIndex_ExitInvalid) {
    EXPECT_CALL(*mockService_, removeLineItem(_, _)).Times(0);

    EXPECT_EQ(run({"remove-item", "1", "0"}).getExitCode(), EXIT_INVALID);
    EXPECT_EQ(run({"remove-item", "1", "two"}).getExitCode(), EXIT_INVALID);
    EXPECT_EQ(run({"remove-item", "1"}).getExitCode(), EXIT_INVALID);
}
