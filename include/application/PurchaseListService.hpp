#pragma once

#include "ports/input/IPurchaseListService.hpp"
#include "ports/output/IQuoteStorage.hpp"
#include "settings/QuoteSettings.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <utility>

namespace quotedesk::application {

/**
 * @brief Списки закупки по котировкам
 *
 * Строки котировки группируются по (деталь, поставщик):
 * количество суммируется, цены берутся минимальные.
 * Пустые деталь/поставщик заменяются на "<unknown>".
 */
class PurchaseListService : public ports::input::IPurchaseListService {
public:
    PurchaseListService(
        std::shared_ptr<ports::output::IQuoteStorage> storage,
        std::shared_ptr<settings::QuoteSettings> settings
    ) : storage_(std::move(storage))
      , settings_(std::move(settings))
    {}

    std::vector<domain::PurchaseList> buildAll() override {
        auto quotes = storage_->load();

        std::vector<domain::PurchaseList> result;
        result.reserve(quotes.size());
        for (const auto& quote : quotes) {
            result.push_back(build(quote));
        }
        std::clog << "[PurchaseListService] Built " << result.size() << " purchase lists" << std::endl;
        return result;
    }

    domain::PurchaseList build(const domain::Quote& quote) override {
        domain::PurchaseList list;
        list.quoteName = quote.name.empty() ? quote.displayName(settings_->getNamePrefix()) : quote.name;
        list.poNumber = quote.poNumber;

        // std::map даёт сортировку по (деталь, поставщик)
        std::map<std::pair<std::string, std::string>, domain::PurchaseRow> grouped;
        for (const auto& item : quote.items) {
            std::string part = domain::Quote::supplierKey(item.partNumber);
            std::string source = domain::Quote::supplierKey(item.source);

            auto key = std::make_pair(part, source);
            auto it = grouped.find(key);
            if (it == grouped.end()) {
                domain::PurchaseRow row;
                row.partNumber = part;
                row.source = source;
                row.quantity = item.quantity;
                row.unitCost = item.unitCost;
                row.listPrice = item.listPrice;
                grouped.emplace(key, row);
            } else {
                auto& row = it->second;
                row.quantity += item.quantity;
                row.unitCost = std::min(row.unitCost, item.unitCost);
                row.listPrice = std::min(row.listPrice, item.listPrice);
            }
        }

        for (auto& [key, row] : grouped) {
            list.rows.push_back(std::move(row));
        }
        return list;
    }

private:
    std::shared_ptr<ports::output::IQuoteStorage> storage_;
    std::shared_ptr<settings::QuoteSettings> settings_;
};

} // namespace quotedesk::application
