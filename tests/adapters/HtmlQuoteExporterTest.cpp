/**
 * @file HtmlQuoteExporterTest.cpp
 * @brief Тесты HTML экспорта
 */

#include <gtest/gtest.h>
#include "adapters/secondary/export/HtmlQuoteExporter.hpp"
#include "mocks/TempDirectory.hpp"

using namespace quotedesk;
using namespace quotedesk::adapters::secondary;
using namespace quotedesk::tests;

class HtmlQuoteExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        exporter_ = std::make_shared<HtmlQuoteExporter>(std::make_shared<settings::ExportSettings>(
            settings::ExportBackend::HTML, "ARC-Works Quote Manager", "$"));
    }

    std::shared_ptr<HtmlQuoteExporter> exporter_;
};

TEST_F(HtmlQuoteExporterTest, Render_EmptyQuote) {
    domain::Quote quote("1", "Empty");
    std::string html = exporter_->render(quote);

    EXPECT_EQ(html.rfind("<!DOCTYPE html>", 0), 0u);
    EXPECT_NE(html.find("<tbody>\n</tbody>"), std::string::npos);
    EXPECT_NE(html.find("<td class=\"num\">$0.00</td>"), std::string::npos);
    EXPECT_NE(html.find("</html>"), std::string::npos);
    EXPECT_EQ(html.find("PO#"), std::string::npos);
}

TEST_F(HtmlQuoteExporterTest, Render_RowsAndTotal) {
    domain::Quote quote("1", "Job");
    quote.poNumber = "77";
    quote.items.push_back(domain::LineItem("A-1", "Bolt", 4,
        domain::Money::fromDouble(0.5), domain::Money::fromDouble(1.25), "Acme"));

    std::string html = exporter_->render(quote);

    EXPECT_NE(html.find("<p class=\"meta\">PO#: 77</p>"), std::string::npos);
    EXPECT_NE(html.find("<td class=\"idx\">1</td><td>A-1</td><td>Bolt</td>"), std::string::npos);
    EXPECT_NE(html.find("<td class=\"num\">$1.25</td><td class=\"num\">$5.00</td>"), std::string::npos);
}

TEST_F(HtmlQuoteExporterTest, Render_EscapesUserText) {
    domain::Quote quote("1", "<script>alert('x')</script>");
    quote.notes = "A & B \"quoted\"";

    std::string html = exporter_->render(quote);

    EXPECT_EQ(html.find("<script>"), std::string::npos);
    EXPECT_NE(html.find("&lt;script&gt;alert(&#39;x&#39;)&lt;/script&gt;"), std::string::npos);
    EXPECT_NE(html.find("A &amp; B &quot;quoted&quot;"), std::string::npos);
}

TEST_F(HtmlQuoteExporterTest, ExportQuote_WritesFile) {
    TempDirectory dir;
    exporter_->exportQuote(domain::Quote("1", "Q"), dir.file("q.html"));

    EXPECT_NE(dir.read("q.html").find("<h2>Q</h2>"), std::string::npos);
}

TEST_F(HtmlQuoteExporterTest, ExportQuote_BadPath_ThrowsExportError) {
    TempDirectory dir;
    EXPECT_THROW(exporter_->exportQuote(domain::Quote("1", "Q"), dir.path() / "no" / "q.html"),
                 domain::ExportError);
}
