#pragma once

#include "ports/output/IQuoteExporter.hpp"
#include "adapters/secondary/export/PdfWriter.hpp"
#include "adapters/secondary/export/QuoteReport.hpp"
#include "settings/ExportSettings.hpp"
#include <memory>
#include <string>
#include <vector>

namespace quotedesk::adapters::secondary {

/**
 * @brief Экспорт котировки в табличный PDF (US Letter)
 *
 * Заголовок, PO, заметки, таблица строк с итогом.
 * Если таблица не помещается, она продолжается на следующей
 * странице с повтором строки заголовков.
 */
class PdfQuoteExporter : public ports::output::IQuoteExporter {
public:
    explicit PdfQuoteExporter(std::shared_ptr<settings::ExportSettings> settings);

    std::string name() const override { return "pdf"; }
    std::string fileExtension() const override { return ".pdf"; }

    void exportQuote(const domain::Quote& quote, const std::filesystem::path& path) override;

    /**
     * @brief Отрисовать документ без записи на диск
     */
    PdfWriter render(const domain::Quote& quote) const;

    /**
     * @brief Доступен ли PDF-рендеринг в этой сборке
     */
    static bool isAvailable();

    /**
     * @brief Обрезать строку под ширину колонки, добавив "..."
     */
    static std::string fitText(const std::string& text, PdfWriter::Font font, double size, double width);

    /**
     * @brief Разбить текст на строки не шире width
     */
    static std::vector<std::string> wrapText(const std::string& text, PdfWriter::Font font, double size, double width);

private:
    std::shared_ptr<settings::ExportSettings> settings_;

    double drawTitle(PdfWriter& pdf, const QuoteReport& report) const;
    double drawPageHeader(PdfWriter& pdf, const QuoteReport& report, bool firstPage) const;
    double drawRow(PdfWriter& pdf, const QuoteReport::Row& row, double y, PdfWriter::Font font, bool shaded) const;
};

} // namespace quotedesk::adapters::secondary
