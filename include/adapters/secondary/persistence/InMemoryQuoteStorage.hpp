#pragma once

#include "ports/output/IQuoteStorage.hpp"
#include "domain/Errors.hpp"
#include <optional>
#include <vector>

namespace quotedesk::adapters::secondary {

/**
 * @brief In-memory реализация хранилища котировок
 *
 * Пока ничего не сохранено, ведёт себя как отсутствующий файл.
 */
class InMemoryQuoteStorage : public ports::output::IQuoteStorage {
public:
    InMemoryQuoteStorage() = default;

    explicit InMemoryQuoteStorage(std::vector<domain::Quote> initial)
        : quotes_(std::move(initial)) {}

    std::vector<domain::Quote> load() override {
        if (!quotes_) {
            throw domain::ParseError("No quotes have been saved yet");
        }
        return *quotes_;
    }

    void save(const std::vector<domain::Quote>& quotes) override {
        quotes_ = quotes;
        ++saveCount_;
    }

    /**
     * @brief Сколько раз вызывался save()
     */
    int saveCount() const { return saveCount_; }

    void clear() {
        quotes_.reset();
        saveCount_ = 0;
    }

private:
    std::optional<std::vector<domain::Quote>> quotes_;
    int saveCount_ = 0;
};

} // namespace quotedesk::adapters::secondary
