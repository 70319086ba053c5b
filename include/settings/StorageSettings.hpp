#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>
#include <optional>

namespace quotedesk::settings {

/**
 * @brief Пути к файлам котировок
 *
 * fromEnvironment() читает из ENV:
 * - QUOTEDESK_DATA_DIR (default: $HOME/.quotedesk, без HOME: ./data)
 * - QUOTEDESK_QUOTES_FILE (default: <data dir>/quotes.json)
 * - QUOTEDESK_BUNDLED_QUOTES (default: установленный data/quotes.json,
 *   путь задаётся сборкой через QUOTEDESK_BUNDLED_QUOTES_PATH)
 *
 * Встроенный файл читается, только если файла пользователя нет.
 */
class StorageSettings {
public:
    StorageSettings(std::filesystem::path quotesFile,
                    std::optional<std::filesystem::path> bundledQuotesFile = std::nullopt)
        : quotesFile_(std::move(quotesFile))
        , bundledQuotesFile_(std::move(bundledQuotesFile))
    {}

    static StorageSettings fromEnvironment() {
        std::filesystem::path dataDir;
        if (const char* dir = std::getenv("QUOTEDESK_DATA_DIR")) {
            dataDir = dir;
        } else if (const char* home = std::getenv("HOME")) {
            dataDir = std::filesystem::path(home) / ".quotedesk";
        } else {
            dataDir = "data";
        }

        std::filesystem::path quotesFile = dataDir / "quotes.json";
        if (const char* file = std::getenv("QUOTEDESK_QUOTES_FILE")) {
            quotesFile = file;
        }

        std::optional<std::filesystem::path> bundled = defaultBundledQuotesFile();
        if (const char* file = std::getenv("QUOTEDESK_BUNDLED_QUOTES")) {
            bundled = std::filesystem::path(file);
        }

        return StorageSettings(quotesFile, bundled);
    }

    const std::filesystem::path& getQuotesFile() const { return quotesFile_; }
    const std::optional<std::filesystem::path>& getBundledQuotesFile() const { return bundledQuotesFile_; }

    static std::optional<std::filesystem::path> defaultBundledQuotesFile() {
#ifdef QUOTEDESK_BUNDLED_QUOTES_PATH
        return std::filesystem::path(QUOTEDESK_BUNDLED_QUOTES_PATH);
#else
        return std::nullopt;
#endif
    }

private:
    std::filesystem::path quotesFile_;
    std::optional<std::filesystem::path> bundledQuotesFile_;
};

} // namespace quotedesk::settings
