#pragma once

#include "ports/output/IQuoteExporter.hpp"
#include "adapters/secondary/export/QuoteReport.hpp"
#include "settings/ExportSettings.hpp"
#include <memory>
#include <string>

namespace quotedesk::adapters::secondary {

/**
 * @brief Экспорт котировки в статический HTML
 *
 * Используется, когда PDF недоступен. Файл открывается в браузере
 * и печатается оттуда.
 */
class HtmlQuoteExporter : public ports::output::IQuoteExporter {
public:
    explicit HtmlQuoteExporter(std::shared_ptr<settings::ExportSettings> settings);

    std::string name() const override { return "html"; }
    std::string fileExtension() const override { return ".html"; }

    void exportQuote(const domain::Quote& quote, const std::filesystem::path& path) override;

    /**
     * @brief Сформировать HTML документ
     */
    std::string render(const domain::Quote& quote) const;

    static std::string escape(const std::string& text);

private:
    std::shared_ptr<settings::ExportSettings> settings_;
};

} // namespace quotedesk::adapters::secondary
