#pragma once

#include "ports/output/IQuoteExporter.hpp"
#include "adapters/secondary/export/PdfQuoteExporter.hpp"
#include "adapters/secondary/export/HtmlQuoteExporter.hpp"
#include "settings/ExportSettings.hpp"
#include <functional>
#include <iostream>
#include <memory>

namespace quotedesk::adapters::secondary {

/**
 * @brief Выбор экспортёра при старте приложения
 *
 * auto/pdf: PDF, если рендеринг доступен, иначе HTML.
 * html: всегда HTML.
 * Выбор делается один раз; ошибка рендеринга PDF не приводит
 * к повтору в HTML.
 */
class QuoteExporterFactory {
public:
    using Probe = std::function<bool()>;

    static std::shared_ptr<ports::output::IQuoteExporter> create(
        std::shared_ptr<settings::ExportSettings> settings,
        const Probe& pdfAvailable = &PdfQuoteExporter::isAvailable)
    {
        auto backend = settings->getBackend();

        if (backend != settings::ExportBackend::HTML) {
            if (pdfAvailable()) {
                std::clog << "[QuoteExporterFactory] Using PDF exporter" << std::endl;
                return std::make_shared<PdfQuoteExporter>(std::move(settings));
            }
            std::clog << "[QuoteExporterFactory] PDF rendering unavailable, falling back to HTML" << std::endl;
        }

        std::clog << "[QuoteExporterFactory] Using HTML exporter" << std::endl;
        return std::make_shared<HtmlQuoteExporter>(std::move(settings));
    }
};

} // namespace quotedesk::adapters::secondary
