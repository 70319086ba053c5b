#pragma once

#include "domain/Quote.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace quotedesk::adapters::secondary {

/**
 * @brief Маппинг Quote <-> JSON файла котировок
 *
 * Формат совместим со старыми файлами:
 * - id может быть числом (unix time) или строкой
 * - line_total пишется для удобства чтения, но при загрузке игнорируется
 * - отсутствующие поля получают значения по умолчанию
 * - количество и цены проверяются теми же границами, что и ввод
 */
class QuoteJson {
public:
    static nlohmann::json itemToJson(const domain::LineItem& item) {
        nlohmann::json j;
        j["part_number"] = item.partNumber;
        j["description"] = item.description;
        j["quantity"] = item.quantity;
        j["unit_cost"] = item.unitCost.toDouble();
        j["list_price"] = item.listPrice.toDouble();
        j["source"] = item.source;
        j["tax_exempt"] = item.taxExempt;
        j["line_total"] = item.extendedPrice().toDouble();
        return j;
    }

    static domain::LineItem itemFromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw domain::ParseError("Line item must be a JSON object");
        }
        domain::LineItem item;
        item.partNumber = stringOrEmpty(j, "part_number");
        item.description = stringOrEmpty(j, "description");
        item.quantity = quantityOrZero(j, item.partNumber);
        item.unitCost = moneyOrZero(j, "unit_cost", item.partNumber);
        item.listPrice = moneyOrZero(j, "list_price", item.partNumber);
        item.source = stringOrEmpty(j, "source");
        item.taxExempt = j.value("tax_exempt", false);
        return item;
    }

    static nlohmann::json toJson(const domain::Quote& quote) {
        nlohmann::json j;
        j["id"] = quote.id;
        j["name"] = quote.name;
        if (quote.poNumber) {
            j["po_number"] = *quote.poNumber;
        }
        j["notes"] = quote.notes;
        j["created_at"] = quote.createdAt.toString();
        j["modified_at"] = quote.modifiedAt.toString();

        j["items"] = nlohmann::json::array();
        for (const auto& item : quote.items) {
            j["items"].push_back(itemToJson(item));
        }

        j["suppliers"] = nlohmann::json::object();
        for (const auto& [source, settings] : quote.suppliers) {
            j["suppliers"][source] = {{"tax_exempt", settings.taxExempt}};
        }
        return j;
    }

    /**
     * @throws domain::ParseError если структура не похожа на котировку
     */
    static domain::Quote fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw domain::ParseError("Quote must be a JSON object");
        }

        try {
            domain::Quote quote;
            quote.id = idToString(j.contains("id") ? j["id"] : nlohmann::json());
            quote.name = stringOrEmpty(j, "name");

            std::string po = stringOrEmpty(j, "po_number");
            if (!po.empty()) {
                quote.poNumber = po;
            }
            quote.notes = stringOrEmpty(j, "notes");

            std::string created = stringOrEmpty(j, "created_at");
            if (!created.empty()) {
                quote.createdAt = domain::Timestamp::fromString(created);
            }
            std::string modified = stringOrEmpty(j, "modified_at");
            quote.modifiedAt = modified.empty()
                ? quote.createdAt
                : domain::Timestamp::fromString(modified);

            if (j.contains("items") && !j["items"].is_null()) {
                if (!j["items"].is_array()) {
                    throw domain::ParseError("Quote " + quote.id + ": items must be an array");
                }
                for (const auto& item : j["items"]) {
                    quote.items.push_back(itemFromJson(item));
                }
            }

            if (j.contains("suppliers") && j["suppliers"].is_object()) {
                for (const auto& [source, value] : j["suppliers"].items()) {
                    domain::SupplierSettings settings;
                    if (value.is_object()) {
                        settings.taxExempt = value.value("tax_exempt", false);
                    } else if (value.is_boolean()) {
                        settings.taxExempt = value.get<bool>();
                    }
                    quote.suppliers[source] = settings;
                }
            }
            return quote;

        } catch (const nlohmann::json::exception& e) {
            throw domain::ParseError(std::string("Invalid quote JSON: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw domain::ParseError(std::string("Invalid quote JSON: ") + e.what());
        }
    }

    static nlohmann::json toJson(const std::vector<domain::Quote>& quotes) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& quote : quotes) {
            j.push_back(toJson(quote));
        }
        return j;
    }

    static std::vector<domain::Quote> listFromJson(const nlohmann::json& j) {
        if (!j.is_array()) {
            throw domain::ParseError("Quotes file must contain a JSON array");
        }
        std::vector<domain::Quote> quotes;
        quotes.reserve(j.size());
        for (const auto& item : j) {
            quotes.push_back(fromJson(item));
        }
        return quotes;
    }

private:
    static std::string stringOrEmpty(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j[key].is_null()) {
            return "";
        }
        if (j[key].is_string()) {
            return j[key].get<std::string>();
        }
        return j[key].dump();
    }

    static int64_t quantityOrZero(const nlohmann::json& j, const std::string& part) {
        if (!j.contains("quantity") || j["quantity"].is_null()) {
            return 0;
        }
        const auto& value = j["quantity"];
        if (!value.is_number()) {
            throw domain::ParseError("Line item '" + part + "': quantity must be a number");
        }

        double quantity = value.get<double>();
        if (quantity != std::trunc(quantity)) {
            throw domain::ParseError("Line item '" + part + "': quantity must be a whole number, got "
                                     + value.dump());
        }
        if (quantity < 0 || quantity > static_cast<double>(domain::LineItem::MAX_QUANTITY)) {
            throw domain::ParseError("Line item '" + part + "': quantity out of range: " + value.dump());
        }
        return static_cast<int64_t>(quantity);
    }

    static domain::Money moneyOrZero(const nlohmann::json& j, const char* key, const std::string& part) {
        if (!j.contains(key) || j[key].is_null()) {
            return domain::Money();
        }
        if (!j[key].is_number()) {
            throw domain::ParseError("Line item '" + part + "': " + key + " must be a number");
        }

        double value = j[key].get<double>();
        if (!std::isfinite(value) || value < 0
            || value > static_cast<double>(domain::LineItem::MAX_PRICE_UNITS)) {
            throw domain::ParseError("Line item '" + part + "': " + key + " out of range: " + j[key].dump());
        }
        return domain::Money::fromDouble(value);
    }

    static std::string idToString(const nlohmann::json& id) {
        if (id.is_string()) {
            return id.get<std::string>();
        }
        if (id.is_number_integer()) {
            return std::to_string(id.get<int64_t>());
        }
        if (id.is_number()) {
            return std::to_string(static_cast<int64_t>(id.get<double>()));
        }
        throw domain::ParseError("Quote id is missing");
    }
};

} // namespace quotedesk::adapters::secondary
