#pragma once

#include "CommandRequest.hpp"
#include "CommandResponse.hpp"
#include "domain/Errors.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace quotedesk::adapters::primary {

/**
 * @brief Обработчик одной или нескольких команд CLI
 */
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    virtual void handle(const CommandRequest& req, CommandResponse& res) = 0;
};

/**
 * @brief Код завершения по типу исключения
 */
inline int exitCodeFor(const std::exception& e) {
    if (dynamic_cast<const domain::ValidationError*>(&e)) return EXIT_INVALID;
    if (dynamic_cast<const domain::ParseError*>(&e)) return EXIT_INVALID;
    if (dynamic_cast<const std::invalid_argument*>(&e)) return EXIT_INVALID;
    return EXIT_IO_ERROR;
}

/**
 * @brief Позиционный аргумент, обязательный для команды
 *
 * @throws domain::ValidationError если аргумента нет
 */
inline std::string requireArg(const CommandRequest& req, size_t index, const std::string& what) {
    auto value = req.getArg(index);
    if (!value || value->empty()) {
        throw domain::ValidationError("Missing " + what + " (usage: quotedesk help)");
    }
    return *value;
}

/**
 * @brief Номер строки (с единицы) в индекс с нуля
 */
inline size_t parseItemNumber(const std::string& raw) {
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        throw domain::ValidationError("Line item number must be a positive integer: '" + raw + "'");
    }
    unsigned long long number = 0;
    try {
        number = std::stoull(raw);
    } catch (const std::out_of_range&) {
        throw domain::ValidationError("Line item number is too large: '" + raw + "'");
    }
    if (number == 0) {
        throw domain::ValidationError("Line item numbers start at 1");
    }
    return static_cast<size_t>(number - 1);
}

} // namespace quotedesk::adapters::primary
