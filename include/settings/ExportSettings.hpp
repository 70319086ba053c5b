#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace quotedesk::settings {

/**
 * @brief Желаемый формат экспорта
 */
enum class ExportBackend {
    AUTO,   ///< PDF, если доступен, иначе HTML
    PDF,
    HTML
};

inline ExportBackend exportBackendFromString(const std::string& str) {
    if (str == "auto") return ExportBackend::AUTO;
    if (str == "pdf")  return ExportBackend::PDF;
    if (str == "html") return ExportBackend::HTML;
    throw std::invalid_argument("Unknown export backend: " + str);
}

inline std::string toString(ExportBackend backend) {
    switch (backend) {
        case ExportBackend::AUTO: return "auto";
        case ExportBackend::PDF:  return "pdf";
        case ExportBackend::HTML: return "html";
    }
    return "auto";
}

/**
 * @brief Настройки экспорта документов
 *
 * fromEnvironment() читает из ENV:
 * - QUOTEDESK_EXPORT_BACKEND (auto|pdf|html, default: auto)
 * - QUOTEDESK_APP_TITLE (default: "ARC-Works Quote Manager")
 * - QUOTEDESK_CURRENCY_SYMBOL (default: "$")
 */
class ExportSettings {
public:
    ExportSettings(ExportBackend backend = ExportBackend::AUTO,
                   std::string title = "ARC-Works Quote Manager",
                   std::string currencySymbol = "$")
        : backend_(backend)
        , title_(std::move(title))
        , currencySymbol_(std::move(currencySymbol))
    {}

    static ExportSettings fromEnvironment() {
        ExportSettings s;
        if (const char* val = std::getenv("QUOTEDESK_EXPORT_BACKEND")) {
            s.backend_ = exportBackendFromString(val);
        }
        if (const char* val = std::getenv("QUOTEDESK_APP_TITLE")) {
            s.title_ = val;
        }
        if (const char* val = std::getenv("QUOTEDESK_CURRENCY_SYMBOL")) {
            s.currencySymbol_ = val;
        }
        return s;
    }

    ExportBackend getBackend() const { return backend_; }
    const std::string& getTitle() const { return title_; }
    const std::string& getCurrencySymbol() const { return currencySymbol_; }

private:
    ExportBackend backend_;
    std::string title_;
    std::string currencySymbol_;
};

} // namespace quotedesk::settings
