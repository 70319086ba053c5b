#pragma once

#include "domain/LineItem.hpp"
#include "domain/LineItemInput.hpp"
#include "domain/Money.hpp"
#include "domain/Errors.hpp"
#include <string>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace quotedesk::application {

/**
 * @brief Разбор и проверка полей строки котировки
 *
 * Количество: целое от 0 до LineItem::MAX_QUANTITY. Цены: неотрицательные
 * десятичные числа не больше LineItem::MAX_PRICE_UNITS (допускается ведущий '$').
 * При ошибке бросает ValidationError с именем поля.
 */
class LineItemParser {
public:
    static domain::LineItem parse(const domain::LineItemInput& input) {
        domain::LineItem item;
        item.partNumber = trim(input.partNumber);
        item.description = trim(input.description);
        item.quantity = parseQuantity(input.quantity);
        item.unitCost = parseMoney(input.unitCost, "Unit cost");
        item.listPrice = parseMoney(input.listPrice, "List price");
        item.source = trim(input.source);
        item.taxExempt = input.taxExempt;
        return item;
    }

    static int64_t parseQuantity(const std::string& raw) {
        std::string text = trim(raw);
        if (text.empty()) {
            throw domain::ValidationError("Quantity is required");
        }
        for (char c : text) {
            if (c < '0' || c > '9') {
                throw domain::ValidationError("Quantity must be a non-negative whole number: '" + raw + "'");
            }
        }
        int64_t quantity = 0;
        try {
            quantity = std::stoll(text);
        } catch (const std::out_of_range&) {
            throw domain::ValidationError("Quantity is too large: '" + raw + "'");
        }
        if (quantity > domain::LineItem::MAX_QUANTITY) {
            throw domain::ValidationError("Quantity is too large: '" + raw + "' (max "
                                          + std::to_string(domain::LineItem::MAX_QUANTITY) + ")");
        }
        return quantity;
    }

    static domain::Money parseMoney(const std::string& raw, const std::string& field) {
        std::string text = trim(raw);
        if (!text.empty() && text[0] == '$') {
            text = trim(text.substr(1));
        }
        if (text.empty()) {
            throw domain::ValidationError(field + " is required");
        }

        double value = 0.0;
        size_t consumed = 0;
        try {
            value = std::stod(text, &consumed);
        } catch (const std::exception&) {
            throw domain::ValidationError(field + " must be a number: '" + raw + "'");
        }
        if (consumed != text.size() || !std::isfinite(value)) {
            throw domain::ValidationError(field + " must be a number: '" + raw + "'");
        }
        if (value < 0) {
            throw domain::ValidationError(field + " must be non-negative: '" + raw + "'");
        }
        if (value > static_cast<double>(domain::LineItem::MAX_PRICE_UNITS)) {
            throw domain::ValidationError(field + " is too large: '" + raw + "' (max "
                                          + std::to_string(domain::LineItem::MAX_PRICE_UNITS) + ")");
        }
        return domain::Money::fromDouble(value);
    }

    static std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }
};

} // namespace quotedesk::application
