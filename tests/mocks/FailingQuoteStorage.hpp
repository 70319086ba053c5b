#pragma once

#include "adapters/secondary/persistence/InMemoryQuoteStorage.hpp"
#include "domain/Errors.hpp"

namespace quotedesk::tests {

/**
 * @brief Хранилище, у которого можно "сломать" запись
 */
class FailingQuoteStorage : public adapters::secondary::InMemoryQuoteStorage {
public:
    using InMemoryQuoteStorage::InMemoryQuoteStorage;

    void setFailOnSave(bool fail) { failOnSave_ = fail; }

    void save(const std::vector<domain::Quote>& quotes) override {
        if (failOnSave_) {
            throw domain::FileSystemError("Disk full");
        }
        InMemoryQuoteStorage::save(quotes);
    }

private:
    bool failOnSave_ = false;
};

} // namespace quotedesk::tests
