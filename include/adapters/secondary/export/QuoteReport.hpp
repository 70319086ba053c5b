#pragma once

#include "domain/Quote.hpp"
#include "settings/ExportSettings.hpp"
#include <string>
#include <vector>
#include <array>
#include <optional>

namespace quotedesk::adapters::secondary {

/**
 * @brief Содержимое документа котировки, общее для PDF и HTML
 *
 * Все значения уже отформатированы в строки.
 */
struct QuoteReport {
    static constexpr size_t COLUMN_COUNT = 6;
    using Row = std::array<std::string, COLUMN_COUNT>;

    std::string title;
    std::string heading;
    std::optional<std::string> poNumber;
    std::string notes;
    std::string date;
    Row header;
    std::vector<Row> rows;
    std::string totalLabel;
    std::string total;

    static QuoteReport build(const domain::Quote& quote, const settings::ExportSettings& settings) {
        const std::string& currency = settings.getCurrencySymbol();

        QuoteReport report;
        report.title = settings.getTitle();
        report.heading = quote.name;
        report.poNumber = quote.poNumber;
        report.notes = quote.notes;
        report.date = quote.createdAt.toDateString();
        report.header = {"No", "Part", "Description", "Qty", "Unit", "Line"};

        size_t index = 1;
        for (const auto& item : quote.items) {
            report.rows.push_back({
                std::to_string(index++),
                item.partNumber,
                item.description,
                std::to_string(item.quantity),
                currency + item.listPrice.toString(),
                currency + item.extendedPrice().toString()
            });
        }

        report.totalLabel = "Total";
        report.total = currency + quote.totalPrice().toString();
        return report;
    }
};

} // namespace quotedesk::adapters::secondary
