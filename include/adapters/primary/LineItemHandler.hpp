#pragma once

#include "ICommandHandler.hpp"
#include "ports/input/IQuoteService.hpp"
#include <cstdio>
#include <iostream>
#include <memory>

namespace quotedesk::adapters::primary {

/**
 * @brief Команды редактирования строк котировки
 *
 * - add-item <id> --part P --desc D --qty Q --cost C --list L [--source S]
 * - edit-item <id> <n> [те же опции; пропущенные не меняются]
 * - remove-item <id> <n>
 *
 * Номера строк в CLI начинаются с 1.
 */
class LineItemHandler : public ICommandHandler {
public:
    explicit LineItemHandler(std::shared_ptr<ports::input::IQuoteService> quoteService)
        : quoteService_(std::move(quoteService))
    {
        std::clog << "[LineItemHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        const std::string& command = req.getCommand();

        try {
            if (command == "add-item") {
                handleAdd(req, res);
            } else if (command == "edit-item") {
                handleEdit(req, res);
            } else if (command == "remove-item") {
                handleRemove(req, res);
            } else {
                res.setError(EXIT_INVALID, "Unknown command: " + command);
            }
        } catch (const std::exception& e) {
            std::cerr << "[LineItemHandler] " << command << " failed: " << e.what() << std::endl;
            res.setError(exitCodeFor(e), e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IQuoteService> quoteService_;

    void handleAdd(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");

        domain::LineItemInput input;
        applyOptions(req, input);

        auto quote = quoteService_->addLineItem(id, input);
        res.out() << "Added line item " << quote.items.size() << " to quote " << quote.id
                  << " (total " << quote.totalPrice().toString() << ")\n";
    }

    void handleEdit(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");
        size_t index = parseItemNumber(requireArg(req, 1, "line item number"));

        auto existing = quoteService_->findQuote(id);
        if (!existing) {
            throw domain::ValidationError("Quote not found: " + id);
        }
        if (index >= existing->items.size()) {
            throw domain::ValidationError("Line item " + std::to_string(index + 1) + " does not exist");
        }

        domain::LineItemInput input = toInput(existing->items[index]);
        applyOptions(req, input);

        auto quote = quoteService_->editLineItem(id, index, input);
        res.out() << "Updated line item " << (index + 1) << " of quote " << quote.id
                  << " (total " << quote.totalPrice().toString() << ")\n";
    }

    void handleRemove(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");
        size_t index = parseItemNumber(requireArg(req, 1, "line item number"));

        auto quote = quoteService_->removeLineItem(id, index);
        res.out() << "Removed line item " << (index + 1) << " from quote " << quote.id
                  << " (" << quote.items.size() << " items left)\n";
    }

    static void applyOptions(const CommandRequest& req, domain::LineItemInput& input) {
        if (auto v = req.getOption("part"))   input.partNumber = *v;
        if (auto v = req.getOption("desc"))   input.description = *v;
        if (auto v = req.getOption("qty"))    input.quantity = *v;
        if (auto v = req.getOption("cost"))   input.unitCost = *v;
        if (auto v = req.getOption("list"))   input.listPrice = *v;
        if (auto v = req.getOption("source")) input.source = *v;
    }

    static domain::LineItemInput toInput(const domain::LineItem& item) {
        domain::LineItemInput input;
        input.partNumber = item.partNumber;
        input.description = item.description;
        input.quantity = std::to_string(item.quantity);
        input.unitCost = exact(item.unitCost);
        input.listPrice = exact(item.listPrice);
        input.source = item.source;
        input.taxExempt = item.taxExempt;
        return input;
    }

    // Без округления до центов, чтобы не менять непереданные поля
    static std::string exact(const domain::Money& value) {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "%lld.%09d",
                      static_cast<long long>(value.units), static_cast<int>(value.nano));
        return buf;
    }
};

} // namespace quotedesk::adapters::primary
