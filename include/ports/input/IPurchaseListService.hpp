#pragma once

#include "domain/PurchaseList.hpp"
#include "domain/Quote.hpp"
#include <vector>

namespace quotedesk::ports::input {

/**
 * @brief Интерфейс сервиса списков закупки
 */
class IPurchaseListService {
public:
    virtual ~IPurchaseListService() = default;

    /**
     * @brief Списки закупки по всем сохранённым котировкам
     *
     * @throws domain::ParseError если файл котировок не найден
     */
    virtual std::vector<domain::PurchaseList> buildAll() = 0;

    /**
     * @brief Агрегировать строки одной котировки по (деталь, поставщик)
     */
    virtual domain::PurchaseList build(const domain::Quote& quote) = 0;
};

} // namespace quotedesk::ports::input
