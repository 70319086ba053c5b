#pragma once

#include "ICommandHandler.hpp"
#include "ports/input/IQuoteService.hpp"
#include <filesystem>
#include <iostream>
#include <memory>

namespace quotedesk::adapters::primary {

/**
 * @brief Экспорт и импорт котировок
 *
 * - export <id> <path>       → PDF или HTML (формат выбран при старте)
 * - export-json <id> <path>  → одна котировка в JSON
 * - import-json <path>       → добавить котировку из JSON
 */
class ExportHandler : public ICommandHandler {
public:
    explicit ExportHandler(std::shared_ptr<ports::input::IQuoteService> quoteService)
        : quoteService_(std::move(quoteService))
    {
        std::clog << "[ExportHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        const std::string& command = req.getCommand();

        try {
            if (command == "export") {
                handleExport(req, res);
            } else if (command == "export-json") {
                handleExportJson(req, res);
            } else if (command == "import-json") {
                handleImportJson(req, res);
            } else {
                res.setError(EXIT_INVALID, "Unknown command: " + command);
            }
        } catch (const std::exception& e) {
            std::cerr << "[ExportHandler] " << command << " failed: " << e.what() << std::endl;
            res.setError(exitCodeFor(e), e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IQuoteService> quoteService_;

    void handleExport(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");
        std::filesystem::path path = requireArg(req, 1, "output path");

        // Без расширения добавляем расширение выбранного формата
        if (!path.has_extension()) {
            path += "." + quoteService_->exporterName();
        }

        quoteService_->exportDocument(id, path);
        res.out() << "Exported quote " << id << " as " << quoteService_->exporterName()
                  << " to " << path.string() << "\n";
    }

    void handleExportJson(const CommandRequest& req, CommandResponse& res) {
        std::string id = requireArg(req, 0, "quote id");
        std::filesystem::path path = requireArg(req, 1, "output path");

        quoteService_->exportQuoteJson(id, path);
        res.out() << "Exported quote " << id << " to " << path.string() << "\n";
    }

    void handleImportJson(const CommandRequest& req, CommandResponse& res) {
        std::filesystem::path path = requireArg(req, 0, "input path");

        auto quote = quoteService_->importQuoteJson(path);
        res.out() << "Imported quote " << quote.id << ": " << quote.name
                  << " (" << quote.items.size() << " items)\n";
    }
};

} // namespace quotedesk::adapters::primary
