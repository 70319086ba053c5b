#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace quotedesk::domain {

/**
 * @brief Строка котировки: деталь, количество, цены
 */
class LineItem {
public:
    /// Верхние границы, при которых итоги котировки считаются без переполнения
    static constexpr int64_t MAX_QUANTITY = 1000000;
    static constexpr int64_t MAX_PRICE_UNITS = 1000000000;

    std::string partNumber;
    std::string description;
    int64_t quantity = 1;
    Money unitCost;         // Закупочная цена
    Money listPrice;        // Цена для клиента
    std::string source;     // Поставщик
    bool taxExempt = false;

    LineItem() = default;

    LineItem(const std::string& part, const std::string& desc, int64_t qty,
             const Money& cost, const Money& list, const std::string& src = "")
        : partNumber(part)
        , description(desc)
        , quantity(qty)
        , unitCost(cost)
        , listPrice(list)
        , source(src)
    {}

    Money extendedPrice() const {
        return listPrice * quantity;
    }

    Money extendedCost() const {
        return unitCost * quantity;
    }

    /**
     * @brief Маржа в процентах: (list - cost) / list * 100
     *
     * @return nullopt, если цена нулевая, а закупка нет
     */
    std::optional<double> marginPercent() const {
        if (listPrice.isZero()) {
            if (unitCost.isZero()) return 0.0;
            return std::nullopt;
        }
        double list = listPrice.toDouble();
        return (list - unitCost.toDouble()) / list * 100.0;
    }

    bool isValid() const {
        return quantity >= 0 && quantity <= MAX_QUANTITY
            && !unitCost.isNegative() && !listPrice.isNegative()
            && !exceedsMaxPrice(unitCost) && !exceedsMaxPrice(listPrice);
    }

    static bool exceedsMaxPrice(const Money& price) {
        return price > Money(MAX_PRICE_UNITS, 0);
    }

    bool operator==(const LineItem& other) const {
        return partNumber == other.partNumber
            && description == other.description
            && quantity == other.quantity
            && unitCost == other.unitCost
            && listPrice == other.listPrice
            && source == other.source
            && taxExempt == other.taxExempt;
    }

    bool operator!=(const LineItem& other) const {
        return !(*this == other);
    }
};

} // namespace quotedesk::domain
