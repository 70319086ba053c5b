#pragma once

#include <string>

namespace quotedesk::domain {

/**
 * @brief Сырые поля строки в том виде, как их ввёл пользователь
 */
struct LineItemInput {
    std::string partNumber;
    std::string description;
    std::string quantity = "1";
    std::string unitCost = "0.00";
    std::string listPrice = "0.00";
    std::string source;
    bool taxExempt = false;
};

} // namespace quotedesk::domain
