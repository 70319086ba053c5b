#pragma once

#include "ICommandHandler.hpp"
#include <iostream>

namespace quotedesk::adapters::primary {

/**
 * @brief help: список команд
 */
class HelpHandler : public ICommandHandler {
public:
    HelpHandler() {
        std::clog << "[HelpHandler] Created" << std::endl;
    }

    void handle(const CommandRequest&, CommandResponse& res) override {
        res.out() <<
            "Usage: quotedesk <command> [args] [--option value]\n"
            "\n"
            "Quotes:\n"
            "  list                                   List saved quotes\n"
            "  show <id>                              Show a quote with its line items\n"
            "  new [--name N] [--po P] [--notes T]    Create and save a new quote\n"
            "  set <id> [--po P] [--notes T]          Update PO number and notes\n"
            "  delete <id>                            Delete a quote\n"
            "\n"
            "Line items (numbered from 1):\n"
            "  add-item <id> --part P --desc D --qty Q --cost C --list L [--source S]\n"
            "  edit-item <id> <n> [same options]      Change the given fields of item n\n"
            "  remove-item <id> <n>                   Remove item n\n"
            "\n"
            "Suppliers:\n"
            "  suppliers <id> [--exempt S]... [--clear]\n"
            "\n"
            "Export:\n"
            "  export <id> <path>                     Write a PDF (or HTML) document\n"
            "  export-json <id> <path>                Write one quote as JSON\n"
            "  import-json <path>                     Add a quote from a JSON file\n"
            "  purchase-list [--json]                 Parts per quote for purchasing\n"
            "\n"
            "Global options:\n"
            "  --file F                               Use F as the quotes file\n";
    }
};

} // namespace quotedesk::adapters::primary
