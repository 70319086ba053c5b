#pragma once

#include <string>

namespace quotedesk::domain {

/// Имя поставщика для строк без source
inline const std::string UNKNOWN_SUPPLIER = "<unknown>";

/**
 * @brief Настройки поставщика в рамках котировки
 */
struct SupplierSettings {
    bool taxExempt = false;

    bool operator==(const SupplierSettings& other) const {
        return taxExempt == other.taxExempt;
    }
};

} // namespace quotedesk::domain
