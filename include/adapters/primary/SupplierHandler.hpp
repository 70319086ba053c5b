#pragma once

#include "ICommandHandler.hpp"
#include "ports/input/IQuoteService.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <set>

namespace quotedesk::adapters::primary {

/**
 * @brief suppliers <id> [--exempt S]... [--clear]
 *
 * Без опций печатает поставщиков котировки и их статус.
 * С --exempt помечает перечисленных поставщиков освобождёнными от налога,
 * остальные становятся облагаемыми. --clear снимает все освобождения.
 */
class SupplierHandler : public ICommandHandler {
public:
    explicit SupplierHandler(std::shared_ptr<ports::input::IQuoteService> quoteService)
        : quoteService_(std::move(quoteService))
    {
        std::clog << "[SupplierHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        try {
            std::string id = requireArg(req, 0, "quote id");
            auto quote = quoteService_->findQuote(id);
            if (!quote) {
                res.setError(EXIT_INVALID, "Quote not found: " + id);
                return;
            }

            auto exempt = req.getOptions("exempt");
            if (!exempt.empty() || req.hasOption("clear")) {
                *quote = quoteService_->updateSuppliers(id, buildMapping(*quote, exempt));
            }
            print(*quote, res.out());
        } catch (const std::exception& e) {
            std::cerr << "[SupplierHandler] Failed: " << e.what() << std::endl;
            res.setError(exitCodeFor(e), e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IQuoteService> quoteService_;

    static std::map<std::string, domain::SupplierSettings> buildMapping(
        const domain::Quote& quote, const std::vector<std::string>& exempt)
    {
        auto names = quote.supplierNames();
        std::set<std::string> known(names.begin(), names.end());

        std::set<std::string> selected;
        for (const auto& raw : exempt) {
            std::string name = domain::Quote::supplierKey(raw);
            if (known.count(name) == 0) {
                throw domain::ValidationError("Supplier '" + name + "' is not used in quote " + quote.id);
            }
            selected.insert(name);
        }

        std::map<std::string, domain::SupplierSettings> mapping;
        for (const auto& name : names) {
            mapping[name] = domain::SupplierSettings{selected.count(name) > 0};
        }
        return mapping;
    }

    static void print(const domain::Quote& quote, std::ostream& out) {
        auto names = quote.supplierNames();
        if (names.empty()) {
            out << "Quote " << quote.id << " has no suppliers.\n";
            return;
        }
        for (const auto& name : names) {
            auto it = quote.suppliers.find(name);
            bool exempt = it != quote.suppliers.end() && it->second.taxExempt;
            out << name << ": " << (exempt ? "tax exempt" : "taxable") << "\n";
        }
    }
};

} // namespace quotedesk::adapters::primary
