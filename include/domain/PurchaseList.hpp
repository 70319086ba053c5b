#pragma once

#include "Money.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace quotedesk::domain {

/**
 * @brief Позиция закупки: деталь у конкретного поставщика
 */
struct PurchaseRow {
    std::string partNumber;
    std::string source;
    int64_t quantity = 0;
    Money unitCost;     // Минимальная по строкам
    Money listPrice;    // Минимальная по строкам
};

/**
 * @brief Список закупки по одной котировке
 */
struct PurchaseList {
    std::string quoteName;
    std::optional<std::string> poNumber;
    std::vector<PurchaseRow> rows;
};

} // namespace quotedesk::domain
