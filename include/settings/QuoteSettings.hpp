#pragma once

#include <string>
#include <cstdlib>

namespace quotedesk::settings {

/**
 * @brief Настройки именования котировок
 *
 * ENV: QUOTEDESK_NAME_PREFIX (default: "ARCS")
 */
class QuoteSettings {
public:
    explicit QuoteSettings(std::string namePrefix = "ARCS")
        : namePrefix_(std::move(namePrefix)) {}

    static QuoteSettings fromEnvironment() {
        const char* prefix = std::getenv("QUOTEDESK_NAME_PREFIX");
        return QuoteSettings(prefix ? prefix : "ARCS");
    }

    const std::string& getNamePrefix() const { return namePrefix_; }

private:
    std::string namePrefix_;
};

} // namespace quotedesk::settings
