#include "adapters/secondary/export/HtmlQuoteExporter.hpp"
#include "domain/Errors.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace quotedesk::adapters::secondary {

namespace {

const char* STYLE = R"(
    body { font-family: Helvetica, Arial, sans-serif; margin: 36px; color: #111; }
    h1 { font-size: 20px; margin: 0 0 6px 0; }
    h2 { font-size: 16px; margin: 0 0 12px 0; }
    .meta { font-size: 12px; margin: 2px 0; }
    .notes { font-size: 12px; white-space: pre-wrap; margin: 8px 0 16px 0; }
    table { border-collapse: collapse; width: 100%; font-size: 12px; }
    th, td { border: 1px solid #888; padding: 4px 6px; }
    th { background: #d4d4d4; text-align: left; }
    td.num, th.num { text-align: right; }
    td.idx { text-align: center; }
    tfoot td { font-weight: bold; }
    @media print { body { margin: 0; } }
)";

} // namespace

HtmlQuoteExporter::HtmlQuoteExporter(std::shared_ptr<settings::ExportSettings> settings)
    : settings_(std::move(settings))
{}

void HtmlQuoteExporter::exportQuote(const domain::Quote& quote, const std::filesystem::path& path) {
    try {
        std::string html = render(quote);

        std::ofstream out;
        out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
        out.open(path, std::ios::out | std::ios::trunc);
        out << html;
        out.close();

        std::clog << "[HtmlQuoteExporter] Exported quote " << quote.id << " to " << path << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "[HtmlQuoteExporter] Export failed: " << e.what() << std::endl;
        throw domain::ExportError("HTML export failed for " + path.string() + ": " + e.what());
    }
}

std::string HtmlQuoteExporter::render(const domain::Quote& quote) const {
    QuoteReport report = QuoteReport::build(quote, *settings_);

    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<title>" << escape(report.heading) << "</title>\n"
         << "<style>" << STYLE << "</style>\n"
         << "</head>\n<body>\n";

    html << "<h1>" << escape(report.title) << "</h1>\n"
         << "<h2>" << escape(report.heading) << "</h2>\n";
    if (report.poNumber) {
        html << "<p class=\"meta\">PO#: " << escape(*report.poNumber) << "</p>\n";
    }
    html << "<p class=\"meta\">Date: " << escape(report.date) << "</p>\n";
    if (!report.notes.empty()) {
        html << "<div class=\"notes\">" << escape(report.notes) << "</div>\n";
    }

    html << "<table>\n<thead>\n<tr>";
    for (size_t col = 0; col < QuoteReport::COLUMN_COUNT; ++col) {
        html << (col >= 3 ? "<th class=\"num\">" : "<th>") << escape(report.header[col]) << "</th>";
    }
    html << "</tr>\n</thead>\n<tbody>\n";

    for (const auto& row : report.rows) {
        html << "<tr>";
        for (size_t col = 0; col < QuoteReport::COLUMN_COUNT; ++col) {
            const char* cls = col == 0 ? " class=\"idx\"" : (col >= 3 ? " class=\"num\"" : "");
            html << "<td" << cls << ">" << escape(row[col]) << "</td>";
        }
        html << "</tr>\n";
    }

    html << "</tbody>\n<tfoot>\n<tr>"
         << "<td colspan=\"5\" class=\"num\">" << escape(report.totalLabel) << "</td>"
         << "<td class=\"num\">" << escape(report.total) << "</td>"
         << "</tr>\n</tfoot>\n</table>\n"
         << "</body>\n</html>\n";

    return html.str();
}

std::string HtmlQuoteExporter::escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default:   result += c;
        }
    }
    return result;
}

} // namespace quotedesk::adapters::secondary
