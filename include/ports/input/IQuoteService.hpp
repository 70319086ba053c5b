#pragma once

#include "domain/Quote.hpp"
#include "domain/LineItemInput.hpp"
#include "domain/SupplierSettings.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quotedesk::ports::input {

/**
 * @brief Интерфейс сервиса котировок
 *
 * Операции над строками и заголовком работают с сохранённой котировкой:
 * загрузить из коллекции, изменить, записать коллекцию целиком.
 */
class IQuoteService {
public:
    virtual ~IQuoteService() = default;

    /**
     * @brief Все котировки в порядке хранения
     */
    virtual std::vector<domain::Quote> listQuotes() = 0;

    virtual std::optional<domain::Quote> findQuote(const std::string& id) = 0;

    /**
     * @brief Новая котировка в памяти (ещё не сохранена)
     */
    virtual domain::Quote createQuote(const std::optional<std::string>& name = std::nullopt) = 0;

    /**
     * @brief Сохранить (добавить или заменить по id) и записать коллекцию
     */
    virtual void saveQuote(const domain::Quote& quote) = 0;

    /**
     * @return false если котировки с таким id нет
     */
    virtual bool deleteQuote(const std::string& id) = 0;

    // ============================================
    // СТРОКИ
    // ============================================

    virtual domain::Quote addLineItem(const std::string& quoteId, const domain::LineItemInput& input) = 0;

    /**
     * @param index Индекс строки с нуля
     */
    virtual domain::Quote editLineItem(const std::string& quoteId, size_t index,
                                       const domain::LineItemInput& input) = 0;

    virtual domain::Quote removeLineItem(const std::string& quoteId, size_t index) = 0;

    // ============================================
    // ЗАГОЛОВОК И ПОСТАВЩИКИ
    // ============================================

    /**
     * @brief Обновить PO и/или заметки (nullopt = не менять)
     */
    virtual domain::Quote updateHeader(const std::string& quoteId,
                                       const std::optional<std::string>& poNumber,
                                       const std::optional<std::string>& notes) = 0;

    virtual domain::Quote updateSuppliers(const std::string& quoteId,
                                          const std::map<std::string, domain::SupplierSettings>& suppliers) = 0;

    // ============================================
    // ИМПОРТ / ЭКСПОРТ
    // ============================================

    virtual void exportQuoteJson(const std::string& quoteId, const std::filesystem::path& path) = 0;

    /**
     * @brief Импортировать котировку из JSON; при совпадении id выдаётся новый
     */
    virtual domain::Quote importQuoteJson(const std::filesystem::path& path) = 0;

    /**
     * @brief Экспорт в PDF или HTML (выбран при старте)
     */
    virtual void exportDocument(const std::string& quoteId, const std::filesystem::path& path) = 0;

    virtual std::string exporterName() const = 0;

    /**
     * @brief Предупреждение, если коллекцию не удалось загрузить при старте
     */
    virtual std::optional<std::string> loadWarning() const = 0;
};

} // namespace quotedesk::ports::input
