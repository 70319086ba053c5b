#pragma once

#include "ports/output/IQuoteArchive.hpp"
#include "adapters/secondary/persistence/JsonFileQuoteStorage.hpp"
#include "adapters/secondary/json/QuoteJson.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace quotedesk::adapters::secondary {

/**
 * @brief Одна котировка как JSON объект в отдельном файле
 */
class JsonQuoteArchive : public ports::output::IQuoteArchive {
public:
    void write(const domain::Quote& quote, const std::filesystem::path& path) override {
        JsonFileQuoteStorage::writeFileAtomically(path, QuoteJson::toJson(quote).dump(4));
        std::clog << "[JsonQuoteArchive] Quote " << quote.id << " exported to " << path << std::endl;
    }

    domain::Quote read(const std::filesystem::path& path) override {
        std::ifstream in(path);
        if (!in) {
            throw domain::ParseError("Cannot open " + path.string());
        }

        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw domain::ParseError("Failed to read " + path.string() + ": " + e.what());
        }

        if (!j.is_object() || !j.contains("items")) {
            throw domain::ParseError(path.string() + " does not appear to be a valid quote JSON");
        }
        return QuoteJson::fromJson(j);
    }
};

} // namespace quotedesk::adapters::secondary
