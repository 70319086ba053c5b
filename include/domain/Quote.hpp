#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "LineItem.hpp"
#include "SupplierSettings.hpp"
#include "Errors.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <algorithm>

namespace quotedesk::domain {

/**
 * @brief Котировка: заголовок (PO, заметки) и упорядоченные строки
 *
 * Итоги не хранятся, а каждый раз пересчитываются по строкам.
 * Все изменяющие операции проверяют ввод и при ошибке бросают
 * ValidationError, не трогая состояние котировки.
 */
class Quote {
public:
    std::string id;
    std::string name;
    std::optional<std::string> poNumber;
    std::string notes;
    Timestamp createdAt;
    Timestamp modifiedAt;
    std::vector<LineItem> items;
    std::map<std::string, SupplierSettings> suppliers;

    Quote() = default;

    Quote(const std::string& id_, const std::string& name_)
        : id(id_)
        , name(name_)
        , createdAt(Timestamp::now())
        , modifiedAt(createdAt)
    {}

    // ============================================
    // СТРОКИ
    // ============================================

    void addItem(const LineItem& item) {
        validate(item);
        items.push_back(item);
        touch();
    }

    void editItem(size_t index, const LineItem& item) {
        checkIndex(index);
        validate(item);
        items[index] = item;
        touch();
    }

    void removeItem(size_t index) {
        checkIndex(index);
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(index));
        touch();
    }

    // ============================================
    // ИТОГИ
    // ============================================

    Money totalPrice() const {
        Money total;
        for (const auto& item : items) {
            total += item.extendedPrice();
        }
        return total;
    }

    Money totalCost() const {
        Money total;
        for (const auto& item : items) {
            total += item.extendedCost();
        }
        return total;
    }

    std::optional<double> marginPercent() const {
        Money price = totalPrice();
        Money cost = totalCost();
        if (price.isZero()) {
            if (cost.isZero()) return 0.0;
            return std::nullopt;
        }
        return (price.toDouble() - cost.toDouble()) / price.toDouble() * 100.0;
    }

    // ============================================
    // ЗАГОЛОВОК
    // ============================================

    /**
     * @brief Стандартное имя: "<prefix> YYYY-MM-DD [PO:xxx]"
     */
    std::string displayName(const std::string& prefix) const {
        std::string result = prefix + " " + createdAt.toDateString();
        if (poNumber && !poNumber->empty()) {
            result += " [PO:" + *poNumber + "]";
        }
        return result;
    }

    void setPoNumber(const std::string& po) {
        if (po.empty()) {
            poNumber.reset();
        } else {
            poNumber = po;
        }
        touch();
    }

    void setNotes(const std::string& text) {
        notes = text;
        touch();
    }

    // ============================================
    // ПОСТАВЩИКИ
    // ============================================

    /**
     * @brief Уникальные поставщики из строк (по алфавиту)
     */
    std::vector<std::string> supplierNames() const {
        std::set<std::string> names;
        for (const auto& item : items) {
            names.insert(supplierKey(item.source));
        }
        return {names.begin(), names.end()};
    }

    /**
     * @brief Применить настройки поставщиков к строкам
     *
     * Поставщики, которых нет в mapping, считаются облагаемыми.
     */
    void applySupplierSettings(const std::map<std::string, SupplierSettings>& mapping) {
        suppliers = mapping;
        for (auto& item : items) {
            auto it = mapping.find(supplierKey(item.source));
            item.taxExempt = it != mapping.end() && it->second.taxExempt;
        }
        touch();
    }

    static std::string supplierKey(const std::string& source) {
        auto begin = source.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return UNKNOWN_SUPPLIER;
        auto end = source.find_last_not_of(" \t\r\n");
        return source.substr(begin, end - begin + 1);
    }

    /**
     * @brief Сравнение по сохраняемым полям (итоги производные)
     */
    bool operator==(const Quote& other) const {
        return id == other.id
            && name == other.name
            && poNumber == other.poNumber
            && notes == other.notes
            && createdAt == other.createdAt
            && modifiedAt == other.modifiedAt
            && items == other.items
            && suppliers == other.suppliers;
    }

    bool operator!=(const Quote& other) const {
        return !(*this == other);
    }

private:
    void touch() {
        modifiedAt = Timestamp::now();
    }

    void checkIndex(size_t index) const {
        if (index >= items.size()) {
            throw ValidationError("Line item " + std::to_string(index + 1) +
                                  " does not exist (quote has " +
                                  std::to_string(items.size()) + " items)");
        }
    }

    static void validate(const LineItem& item) {
        if (item.quantity < 0) {
            throw ValidationError("Quantity must be non-negative");
        }
        if (item.quantity > LineItem::MAX_QUANTITY) {
            throw ValidationError("Quantity must not exceed " + std::to_string(LineItem::MAX_QUANTITY));
        }
        if (item.unitCost.isNegative()) {
            throw ValidationError("Unit cost must be non-negative");
        }
        if (item.listPrice.isNegative()) {
            throw ValidationError("List price must be non-negative");
        }
        if (LineItem::exceedsMaxPrice(item.unitCost) || LineItem::exceedsMaxPrice(item.listPrice)) {
            throw ValidationError("Prices must not exceed " + std::to_string(LineItem::MAX_PRICE_UNITS));
        }
    }
};

} // namespace quotedesk::domain
