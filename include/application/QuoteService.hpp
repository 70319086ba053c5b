#pragma once

#include "ports/input/IQuoteService.hpp"
#include "ports/output/IQuoteStorage.hpp"
#include "ports/output/IQuoteArchive.hpp"
#include "ports/output/IQuoteExporter.hpp"
#include "application/LineItemParser.hpp"
#include "settings/QuoteSettings.hpp"
#include "domain/QuoteStore.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <set>

namespace quotedesk::application {

/**
 * @brief Сервис управления котировками
 *
 * Коллекция загружается один раз в конструкторе. Если файл отсутствует
 * или повреждён, сервис стартует с пустой коллекцией и запоминает
 * предупреждение для показа пользователю.
 *
 * Каждое сохранение записывает всю коллекцию. Если запись не удалась,
 * коллекция в памяти остаётся прежней.
 */
class QuoteService : public ports::input::IQuoteService {
public:
    QuoteService(
        std::shared_ptr<ports::output::IQuoteStorage> storage,
        std::shared_ptr<ports::output::IQuoteArchive> archive,
        std::shared_ptr<ports::output::IQuoteExporter> exporter,
        std::shared_ptr<settings::QuoteSettings> settings
    ) : storage_(std::move(storage))
      , archive_(std::move(archive))
      , exporter_(std::move(exporter))
      , settings_(std::move(settings))
    {
        try {
            store_ = domain::QuoteStore(storage_->load());
            std::clog << "[QuoteService] Loaded " << store_.size() << " quotes" << std::endl;
        } catch (const domain::ParseError& e) {
            std::clog << "[QuoteService] Starting with empty store: " << e.what() << std::endl;
            loadWarning_ = e.what();
        }
    }

    std::vector<domain::Quote> listQuotes() override {
        return store_.quotes();
    }

    std::optional<domain::Quote> findQuote(const std::string& id) override {
        return store_.find(id);
    }

    domain::Quote createQuote(const std::optional<std::string>& name = std::nullopt) override {
        domain::Quote quote(nextId(), "");
        quote.name = name && !name->empty() ? *name : quote.displayName(settings_->getNamePrefix());
        std::clog << "[QuoteService] Created quote " << quote.id << std::endl;
        return quote;
    }

    void saveQuote(const domain::Quote& quote) override {
        if (quote.id.empty()) {
            throw domain::ValidationError("Quote id must not be empty");
        }
        domain::QuoteStore updated = store_;
        updated.upsert(quote);
        storage_->save(updated.quotes());
        store_ = std::move(updated);

        std::clog << "[QuoteService] Saved quote id=" << quote.id << " name=" << quote.name << std::endl;
    }

    bool deleteQuote(const std::string& id) override {
        domain::QuoteStore updated = store_;
        if (!updated.remove(id)) {
            std::clog << "[QuoteService] Quote not found: " << id << std::endl;
            return false;
        }
        storage_->save(updated.quotes());
        store_ = std::move(updated);

        std::clog << "[QuoteService] Deleted quote " << id << std::endl;
        return true;
    }

    domain::Quote addLineItem(const std::string& quoteId, const domain::LineItemInput& input) override {
        auto item = LineItemParser::parse(input);
        return modify(quoteId, [&item](domain::Quote& q) { q.addItem(item); });
    }

    domain::Quote editLineItem(const std::string& quoteId, size_t index,
                               const domain::LineItemInput& input) override {
        auto item = LineItemParser::parse(input);
        return modify(quoteId, [&](domain::Quote& q) { q.editItem(index, item); });
    }

    domain::Quote removeLineItem(const std::string& quoteId, size_t index) override {
        return modify(quoteId, [index](domain::Quote& q) { q.removeItem(index); });
    }

    domain::Quote updateHeader(const std::string& quoteId,
                               const std::optional<std::string>& poNumber,
                               const std::optional<std::string>& notes) override {
        return modify(quoteId, [&](domain::Quote& q) {
            if (poNumber) {
                q.setPoNumber(LineItemParser::trim(*poNumber));
            }
            if (notes) {
                std::string text = *notes;
                while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
                    text.pop_back();
                }
                q.setNotes(text);
            }
        });
    }

    domain::Quote updateSuppliers(const std::string& quoteId,
                                  const std::map<std::string, domain::SupplierSettings>& suppliers) override {
        return modify(quoteId, [&suppliers](domain::Quote& q) { q.applySupplierSettings(suppliers); });
    }

    void exportQuoteJson(const std::string& quoteId, const std::filesystem::path& path) override {
        archive_->write(require(quoteId), path);
    }

    domain::Quote importQuoteJson(const std::filesystem::path& path) override {
        domain::Quote quote = archive_->read(path);

        if (quote.id.empty() || store_.contains(quote.id)) {
            std::string previous = quote.id;
            quote.id = nextId();
            std::clog << "[QuoteService] Imported id " << previous
                      << " already in use, assigned " << quote.id << std::endl;
        }
        quote.name = quote.displayName(settings_->getNamePrefix());

        saveQuote(quote);
        return quote;
    }

    void exportDocument(const std::string& quoteId, const std::filesystem::path& path) override {
        exporter_->exportQuote(require(quoteId), path);
    }

    std::string exporterName() const override {
        return exporter_->name();
    }

    std::optional<std::string> loadWarning() const override {
        return loadWarning_;
    }

private:
    std::shared_ptr<ports::output::IQuoteStorage> storage_;
    std::shared_ptr<ports::output::IQuoteArchive> archive_;
    std::shared_ptr<ports::output::IQuoteExporter> exporter_;
    std::shared_ptr<settings::QuoteSettings> settings_;

    domain::QuoteStore store_;
    std::optional<std::string> loadWarning_;
    std::set<std::string> issuedIds_;

    domain::Quote require(const std::string& quoteId) const {
        auto quote = store_.find(quoteId);
        if (!quote) {
            throw domain::ValidationError("Quote not found: " + quoteId);
        }
        return *quote;
    }

    template <typename Fn>
    domain::Quote modify(const std::string& quoteId, Fn&& change) {
        domain::Quote quote = require(quoteId);
        change(quote);
        saveQuote(quote);
        return quote;
    }

    /**
     * @brief id из времени создания (unix seconds), уникальный в процессе
     */
    std::string nextId() {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        std::string id = std::to_string(seconds);
        while (store_.contains(id) || issuedIds_.count(id) > 0) {
            id = std::to_string(++seconds);
        }
        issuedIds_.insert(id);
        return id;
    }
};

} // namespace quotedesk::application
