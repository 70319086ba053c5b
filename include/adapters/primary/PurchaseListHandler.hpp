#pragma once

#include "ICommandHandler.hpp"
#include "ports/input/IPurchaseListService.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>

namespace quotedesk::adapters::primary {

/**
 * @brief purchase-list [--file F] [--json]
 *
 * Детали по каждой котировке для закупки. Файл котировок
 * подменяется глобальной опцией --file при старте приложения.
 */
class PurchaseListHandler : public ICommandHandler {
public:
    explicit PurchaseListHandler(std::shared_ptr<ports::input::IPurchaseListService> purchaseListService)
        : purchaseListService_(std::move(purchaseListService))
    {
        std::clog << "[PurchaseListHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        std::vector<domain::PurchaseList> lists;
        try {
            lists = purchaseListService_->buildAll();
        } catch (const domain::ParseError& e) {
            std::cerr << "[PurchaseListHandler] " << e.what() << std::endl;
            res.setError(EXIT_NO_QUOTES,
                         std::string("No quotes file found. Create a quote first. (") + e.what() + ")");
            return;
        } catch (const std::exception& e) {
            std::cerr << "[PurchaseListHandler] Failed: " << e.what() << std::endl;
            res.setError(exitCodeFor(e), e.what());
            return;
        }

        if (req.hasOption("json")) {
            res.out() << toJson(lists).dump(2) << "\n";
        } else {
            printLists(lists, res.out());
        }
    }

private:
    std::shared_ptr<ports::input::IPurchaseListService> purchaseListService_;

    static nlohmann::json toJson(const std::vector<domain::PurchaseList>& lists) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& list : lists) {
            nlohmann::json j;
            j["quote"] = list.quoteName;
            j["po"] = list.poNumber ? nlohmann::json(*list.poNumber) : nlohmann::json(nullptr);
            j["parts"] = nlohmann::json::array();
            for (const auto& row : list.rows) {
                nlohmann::json part;
                part["part_number"] = row.partNumber;
                part["source"] = row.source;
                part["quantity"] = row.quantity;
                part["unit_cost"] = row.unitCost.toDouble();
                part["list_price"] = row.listPrice.toDouble();
                j["parts"].push_back(part);
            }
            result.push_back(j);
        }
        return result;
    }

    static void printLists(const std::vector<domain::PurchaseList>& lists, std::ostream& out) {
        if (lists.empty()) {
            out << "No quotes to show.\n";
            return;
        }
        for (const auto& list : lists) {
            if (list.rows.empty()) {
                out << "\n" << list.quoteName << ": (no items)\n";
                continue;
            }
            out << "\n" << std::string(60, '=') << "\n";
            out << list.quoteName;
            if (list.poNumber) {
                out << "   [PO: " << *list.poNumber << "]";
            }
            out << "\n" << std::string(60, '-') << "\n";
            printTable(list.rows, out);
        }
        out << "\n";
    }

    static void printTable(const std::vector<domain::PurchaseRow>& rows, std::ostream& out) {
        const std::vector<std::string> columns = {"Part", "Qty", "Source", "Unit Cost", "List Price"};
        std::vector<size_t> widths(columns.size(), 12);
        for (size_t i = 0; i < columns.size(); ++i) {
            widths[i] = std::max(widths[i], columns[i].size());
        }
        for (const auto& row : rows) {
            widths[0] = std::max(widths[0], row.partNumber.size());
            widths[1] = std::max(widths[1], std::to_string(row.quantity).size());
            widths[2] = std::max(widths[2], row.source.size());
        }

        auto cell = [&out, &widths](size_t column, const std::string& text) {
            if (column > 0) out << "  ";
            out << std::left << std::setw(static_cast<int>(widths[column])) << text;
        };

        for (size_t i = 0; i < columns.size(); ++i) {
            cell(i, columns[i]);
        }
        out << "\n";

        size_t ruler = 2 * (widths.size() - 1);
        for (auto w : widths) ruler += w;
        out << std::string(ruler, '-') << "\n";

        for (const auto& row : rows) {
            cell(0, row.partNumber);
            cell(1, std::to_string(row.quantity));
            cell(2, row.source);
            cell(3, row.unitCost.toString());
            cell(4, row.listPrice.toString());
            out << "\n";
        }
    }
};

} // namespace quotedesk::adapters::primary
