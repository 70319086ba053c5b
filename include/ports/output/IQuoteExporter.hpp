#pragma once

#include "domain/Quote.hpp"
#include <filesystem>
#include <string>

namespace quotedesk::ports::output {

/**
 * @brief Интерфейс экспорта котировки в документ
 *
 * Реализации: PDF (табличный отчёт) и HTML (для печати из браузера).
 * Конкретная реализация выбирается один раз при старте.
 */
class IQuoteExporter {
public:
    virtual ~IQuoteExporter() = default;

    /**
     * @brief Имя формата ("pdf", "html")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Расширение файла с точкой (".pdf")
     */
    virtual std::string fileExtension() const = 0;

    /**
     * @brief Записать документ по пути path
     *
     * @throws domain::ExportError при любой ошибке рендеринга или записи
     */
    virtual void exportQuote(const domain::Quote& quote, const std::filesystem::path& path) = 0;
};

} // namespace quotedesk::ports::output
