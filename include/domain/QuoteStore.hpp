#pragma once

#include "Quote.hpp"
#include "Errors.hpp"
#include <string>
#include <vector>
#include <optional>
#include <algorithm>

namespace quotedesk::domain {

/**
 * @brief Упорядоченная коллекция котировок с поиском по id
 *
 * Хранит порядок добавления, id уникальны.
 */
class QuoteStore {
public:
    QuoteStore() = default;

    /**
     * @throws ParseError при повторяющихся id
     */
    explicit QuoteStore(std::vector<Quote> quotes) {
        for (auto& quote : quotes) {
            if (contains(quote.id)) {
                throw ParseError("Duplicate quote id: " + quote.id);
            }
            quotes_.push_back(std::move(quote));
        }
    }

    std::optional<Quote> find(const std::string& id) const {
        auto it = locate(id);
        if (it == quotes_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    bool contains(const std::string& id) const {
        return locate(id) != quotes_.end();
    }

    /**
     * @brief Заменить котировку с тем же id на месте, либо добавить в конец
     */
    void upsert(const Quote& quote) {
        auto it = std::find_if(quotes_.begin(), quotes_.end(),
            [&quote](const Quote& q) { return q.id == quote.id; });
        if (it != quotes_.end()) {
            *it = quote;
        } else {
            quotes_.push_back(quote);
        }
    }

    /**
     * @brief Удалить ровно одну котировку по id
     * @return true если удалена
     */
    bool remove(const std::string& id) {
        auto it = std::find_if(quotes_.begin(), quotes_.end(),
            [&id](const Quote& q) { return q.id == id; });
        if (it == quotes_.end()) {
            return false;
        }
        quotes_.erase(it);
        return true;
    }

    const std::vector<Quote>& quotes() const { return quotes_; }
    size_t size() const { return quotes_.size(); }
    bool empty() const { return quotes_.empty(); }

    bool operator==(const QuoteStore& other) const {
        return quotes_ == other.quotes_;
    }

private:
    std::vector<Quote> quotes_;

    std::vector<Quote>::const_iterator locate(const std::string& id) const {
        return std::find_if(quotes_.begin(), quotes_.end(),
            [&id](const Quote& q) { return q.id == id; });
    }
};

} // namespace quotedesk::domain
