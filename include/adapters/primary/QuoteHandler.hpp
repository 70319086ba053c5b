#pragma once

#include "ICommandHandler.hpp"
#include "ports/input/IQuoteService.hpp"
#include "settings/ExportSettings.hpp"
#include "settings/QuoteSettings.hpp"
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <memory>

namespace quotedesk::adapters::primary {

/**
 * @brief Команды управления котировками
 *
 * Команды:
 * - list                          → список котировок
 * - show <id>                     → заголовок, строки и итоги
 * - new [--name N] [--po P] [--notes T] → создать и сохранить
 * - set <id> [--po P] [--notes T] → изменить заголовок
 * - delete <id>                   → удалить
 */
class QuoteHandler : public ICommandHandler {
public:
    QuoteHandler(
        std::shared_ptr<ports::input::IQuoteService> quoteService,
        std::shared_ptr<settings::QuoteSettings> quoteSettings,
        std::shared_ptr<settings::ExportSettings> exportSettings
    ) : quoteService_(std::move(quoteService))
      , quoteSettings_(std::move(quoteSettings))
      , exportSettings_(std::move(exportSettings))
    {
        std::clog << "[QuoteHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        const std::string& command = req.getCommand();

        try {
            if (command == "list") {
                handleList(res);
            } else if (command == "show") {
                handleShow(req, res);
            } else if (command == "new") {
                handleNew(req, res);
            } else if (command == "set") {
                handleSet(req, res);
            } else if (command == "delete") {
                handleDelete(req, res);
            } else {
                res.setError(EXIT_INVALID, "Unknown command: " + command);
            }
        } catch (const std::exception& e) {
            std::cerr << "[QuoteHandler] " << command << " failed: " << e.what() << std::endl;
            res.setError(exitCodeFor(e), e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IQuoteService> quoteService_;
    std::shared_ptr<settings::QuoteSettings> quoteSettings_;
    std::shared_ptr<settings::ExportSettings> exportSettings_;

    void handleList(CommandResponse& res) {
        auto quotes = quoteService_->listQuotes();
        if (quotes.empty()) {
            res.out() << "No quotes saved.\n";
            return;
        }

        auto& out = res.out();
        out << std::left << std::setw(12) << "ID" << "  "
            << std::setw(32) << "Name" << "  "
            << std::setw(6) << "Items" << "  " << "Total" << "\n";
        for (const auto& quote : quotes) {
            out << std::left << std::setw(12) << quote.id << "  "
                << std::setw(32) << quote.name << "  "
                << std::setw(6) << quote.items.size() << "  "
                << money(quote.totalPrice()) << "\n";
        }
    }

    void handleShow(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");
        auto quote = quoteService_->findQuote(id);
        if (!quote) {
            res.setError(EXIT_INVALID, "Quote not found: " + id);
            return;
        }
        printQuote(*quote, res.out());
    }

    void handleNew(const CommandRequest& req, CommandResponse& res) {
        auto name = req.getOption("name");
        domain::Quote quote = quoteService_->createQuote(name);

        if (auto po = req.getOption("po")) {
            quote.setPoNumber(*po);
            if (!name || name->empty()) {
                quote.name = quote.displayName(quoteSettings_->getNamePrefix());
            }
        }
        if (auto notes = req.getOption("notes")) {
            quote.setNotes(*notes);
        }

        quoteService_->saveQuote(quote);
        res.out() << "Created quote " << quote.id << ": " << quote.name << "\n";
    }

    void handleSet(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");
        auto po = req.getOption("po");
        auto notes = req.getOption("notes");
        if (!po && !notes) {
            res.setError(EXIT_INVALID, "Nothing to update: pass --po and/or --notes");
            return;
        }

        auto quote = quoteService_->updateHeader(id, po, notes);
        res.out() << "Updated quote " << quote.id << ": " << quote.name << "\n";
    }

    void handleDelete(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");
        if (!quoteService_->deleteQuote(id)) {
            res.setError(EXIT_INVALID, "Quote not found: " + id);
            return;
        }
        res.out() << "Deleted quote " << id << "\n";
    }

    void printQuote(const domain::Quote& quote, std::ostream& out) const {
        out << "Quote " << quote.id << ": " << quote.name << "\n"
            << "PO:       " << quote.poNumber.value_or("-") << "\n"
            << "Created:  " << quote.createdAt.toString() << "\n"
            << "Modified: " << quote.modifiedAt.toString() << "\n";
        if (!quote.notes.empty()) {
            out << "Notes:    " << quote.notes << "\n";
        }
        out << "\n";

        if (quote.items.empty()) {
            out << "(no items)\n";
        } else {
            out << std::left
                << std::setw(4) << "No" << std::setw(16) << "Part" << std::setw(28) << "Description"
                << std::right
                << std::setw(6) << "Qty" << std::setw(12) << "Unit cost" << std::setw(12) << "List"
                << std::setw(12) << "Line" << std::setw(9) << "Margin"
                << "  " << std::left << "Source" << "\n";

            size_t number = 1;
            for (const auto& item : quote.items) {
                out << std::left
                    << std::setw(4) << number++
                    << std::setw(16) << item.partNumber
                    << std::setw(28) << item.description
                    << std::right
                    << std::setw(6) << item.quantity
                    << std::setw(12) << money(item.unitCost)
                    << std::setw(12) << money(item.listPrice)
                    << std::setw(12) << money(item.extendedPrice())
                    << std::setw(9) << percent(item.marginPercent())
                    << "  " << std::left << domain::Quote::supplierKey(item.source)
                    << (item.taxExempt ? " (exempt)" : "") << "\n";
            }
        }

        out << "\n"
            << "Total: " << money(quote.totalPrice())
            << "  Cost: " << money(quote.totalCost())
            << "  Margin: " << percent(quote.marginPercent()) << "\n";
    }

    std::string money(const domain::Money& value) const {
        return exportSettings_->getCurrencySymbol() + value.toString();
    }

    static std::string percent(const std::optional<double>& value) {
        if (!value) return "N/A";
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f%%", *value);
        return buf;
    }
};

} // namespace quotedesk::adapters::primary
