#pragma once

#include "domain/Quote.hpp"
#include <vector>

namespace quotedesk::ports::output {

/**
 * @brief Интерфейс хранилища котировок
 *
 * Output Port: коллекция читается целиком при старте
 * и целиком перезаписывается при каждом сохранении.
 */
class IQuoteStorage {
public:
    virtual ~IQuoteStorage() = default;

    /**
     * @brief Загрузить все котировки
     *
     * @return Котировки в сохранённом порядке
     * @throws domain::ParseError если файла нет или JSON повреждён
     */
    virtual std::vector<domain::Quote> load() = 0;

    /**
     * @brief Перезаписать всю коллекцию
     *
     * @param quotes Котировки для сохранения
     * @throws domain::FileSystemError при ошибке записи
     */
    virtual void save(const std::vector<domain::Quote>& quotes) = 0;
};

} // namespace quotedesk::ports::output
