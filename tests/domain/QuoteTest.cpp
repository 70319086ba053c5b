/**
 * @file QuoteTest.cpp
 * @brief Unit-тесты для Quote и LineItem
 */

#include <gtest/gtest.h>
#include "domain/Quote.hpp"

using namespace quotedesk::domain;

class QuoteTest : public ::testing::Test {
protected:
    void SetUp() override {
        quote_ = Quote("1700000000", "Test quote");
        quote_.createdAt = Timestamp::fromString("2025-03-04T12:00:00Z");
        quote_.modifiedAt = quote_.createdAt;
    }

    static LineItem item(const std::string& part, int64_t qty, double cost, double list,
                         const std::string& source = "") {
        return LineItem(part, part + " description", qty,
                        Money::fromDouble(cost), Money::fromDouble(list), source);
    }

    Quote quote_;
};

// ============================================================================
// LINE ITEM
// ============================================================================

TEST_F(QuoteTest, LineItem_ExtendedPriceIsQuantityTimesList) {
    auto li = item("A-1", 3, 10.0, 19.99);

    EXPECT_EQ(li.extendedPrice().toString(), "59.97");
    EXPECT_EQ(li.extendedCost().toString(), "30.00");
}

TEST_F(QuoteTest, LineItem_Margin) {
    auto li = item("A-1", 1, 75.0, 100.0);
    ASSERT_TRUE(li.marginPercent().has_value());
    EXPECT_NEAR(*li.marginPercent(), 25.0, 1e-9);
}

TEST_F(QuoteTest, LineItem_MarginUndefinedForZeroListPrice) {
    EXPECT_FALSE(item("A-1", 1, 5.0, 0.0).marginPercent().has_value());

    auto free = item("A-2", 1, 0.0, 0.0).marginPercent();
    ASSERT_TRUE(free.has_value());
    EXPECT_DOUBLE_EQ(*free, 0.0);
}

// ============================================================================
// ADD / EDIT / REMOVE
// ============================================================================

TEST_F(QuoteTest, AddItem_AppendsAndTouchesModified) {
    quote_.addItem(item("A-1", 2, 1.0, 2.0));

    ASSERT_EQ(quote_.items.size(), 1u);
    EXPECT_EQ(quote_.items[0].partNumber, "A-1");
    EXPECT_GT(quote_.modifiedAt, quote_.createdAt);
}

TEST_F(QuoteTest, AddItem_NegativeQuantity_ThrowsAndLeavesQuoteUnchanged) {
    quote_.addItem(item("A-1", 2, 1.0, 2.0));
    Quote before = quote_;

    EXPECT_THROW(quote_.addItem(item("BAD", -1, 1.0, 2.0)), ValidationError);
    EXPECT_EQ(quote_, before);
}

TEST_F(QuoteTest, AddItem_NegativePrice_ThrowsAndLeavesQuoteUnchanged) {
    Quote before = quote_;

    EXPECT_THROW(quote_.addItem(item("BAD", 1, 1.0, -0.01)), ValidationError);
    EXPECT_THROW(quote_.addItem(item("BAD", 1, -5.0, 1.0)), ValidationError);
    EXPECT_EQ(quote_, before);
}

TEST_F(QuoteTest, AddItem_AboveLimits_ThrowsAndLeavesQuoteUnchanged) {
    Quote before = quote_;

    EXPECT_THROW(quote_.addItem(item("BIG", LineItem::MAX_QUANTITY + 1, 1.0, 2.0)), ValidationError);
    EXPECT_THROW(quote_.addItem(item("BIG", 1, 1.0, 2e9)), ValidationError);
    EXPECT_EQ(quote_, before);
}

TEST_F(QuoteTest, EditItem_ReplacesInPlace) {
    quote_.addItem(item("A-1", 1, 1.0, 2.0));
    quote_.addItem(item("B-2", 1, 1.0, 2.0));

    quote_.editItem(0, item("A-9", 5, 1.0, 2.0));

    EXPECT_EQ(quote_.items[0].partNumber, "A-9");
    EXPECT_EQ(quote_.items[0].quantity, 5);
    EXPECT_EQ(quote_.items[1].partNumber, "B-2");
}

TEST_F(QuoteTest, EditItem_IndexOutOfRange_Throws) {
    quote_.addItem(item("A-1", 1, 1.0, 2.0));
    Quote before = quote_;

    EXPECT_THROW(quote_.editItem(1, item("X", 1, 1.0, 1.0)), ValidationError);
    EXPECT_THROW(quote_.editItem(0, item("X", -3, 1.0, 1.0)), ValidationError);
    EXPECT_EQ(quote_, before);
}

TEST_F(QuoteTest, RemoveItem_KeepsOrderOfOthers) {
    quote_.addItem(item("A", 1, 1.0, 1.0));
    quote_.addItem(item("B", 1, 1.0, 1.0));
    quote_.addItem(item("C", 1, 1.0, 1.0));

    quote_.removeItem(1);

    ASSERT_EQ(quote_.items.size(), 2u);
    EXPECT_EQ(quote_.items[0].partNumber, "A");
    EXPECT_EQ(quote_.items[1].partNumber, "C");
    EXPECT_THROW(quote_.removeItem(2), ValidationError);
}

// ============================================================================
// TOTALS
// ============================================================================

TEST_F(QuoteTest, TotalPrice_IsSumOfExtendedPrices) {
    quote_.addItem(item("A", 3, 0.5, 0.1));
    quote_.addItem(item("B", 2, 10.0, 19.99));
    quote_.addItem(item("C", 0, 10.0, 1000.0));

    EXPECT_EQ(quote_.totalPrice().toString(), "40.28");
    EXPECT_NEAR(quote_.totalPrice().toDouble(), 3 * 0.1 + 2 * 19.99, 1e-9);
    EXPECT_EQ(quote_.totalCost().toString(), "21.50");
}

TEST_F(QuoteTest, EmptyQuote_TotalsAreZero) {
    EXPECT_TRUE(quote_.totalPrice().isZero());
    EXPECT_TRUE(quote_.totalCost().isZero());
    ASSERT_TRUE(quote_.marginPercent().has_value());
    EXPECT_DOUBLE_EQ(*quote_.marginPercent(), 0.0);
}

// ============================================================================
// HEADER
// ============================================================================

TEST_F(QuoteTest, DisplayName_WithAndWithoutPo) {
    EXPECT_EQ(quote_.displayName("ARCS"), "ARCS 2025-03-04");

    quote_.setPoNumber("PO-77");
    EXPECT_EQ(quote_.displayName("ARCS"), "ARCS 2025-03-04 [PO:PO-77]");
}

TEST_F(QuoteTest, SetPoNumber_EmptyClears) {
    quote_.setPoNumber("PO-1");
    ASSERT_TRUE(quote_.poNumber.has_value());

    quote_.setPoNumber("");
    EXPECT_FALSE(quote_.poNumber.has_value());
}

// ============================================================================
// SUPPLIERS
// ============================================================================

TEST_F(QuoteTest, SupplierNames_DistinctSortedWithUnknown) {
    quote_.addItem(item("A", 1, 1.0, 1.0, "Zeta"));
    quote_.addItem(item("B", 1, 1.0, 1.0, " Acme "));
    quote_.addItem(item("C", 1, 1.0, 1.0, "Acme"));
    quote_.addItem(item("D", 1, 1.0, 1.0, ""));

    auto names = quote_.supplierNames();
    std::vector<std::string> expected = {"<unknown>", "Acme", "Zeta"};
    EXPECT_EQ(names, expected);
}

TEST_F(QuoteTest, ApplySupplierSettings_SetsItemFlags) {
    quote_.addItem(item("A", 1, 1.0, 1.0, "Acme"));
    quote_.addItem(item("B", 1, 1.0, 1.0, "Zeta"));

    quote_.applySupplierSettings({{"Acme", SupplierSettings{true}}, {"Zeta", SupplierSettings{false}}});

    EXPECT_TRUE(quote_.items[0].taxExempt);
    EXPECT_FALSE(quote_.items[1].taxExempt);
    EXPECT_TRUE(quote_.suppliers.at("Acme").taxExempt);
}

TEST_F(QuoteTest, ApplySupplierSettings_MissingSupplierIsTaxable) {
    quote_.addItem(item("A", 1, 1.0, 1.0, "Acme"));
    quote_.items[0].taxExempt = true;

    quote_.applySupplierSettings({});

    EXPECT_FALSE(quote_.items[0].taxExempt);
}
