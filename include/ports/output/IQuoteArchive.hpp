#pragma once

#include "domain/Quote.hpp"
#include <filesystem>

namespace quotedesk::ports::output {

/**
 * @brief Обмен отдельной котировкой через файл
 *
 * Экспортированный файл импортируется обратно в хранилище.
 */
class IQuoteArchive {
public:
    virtual ~IQuoteArchive() = default;

    /**
     * @throws domain::FileSystemError при ошибке записи
     */
    virtual void write(const domain::Quote& quote, const std::filesystem::path& path) = 0;

    /**
     * @throws domain::ParseError если файл не читается или не похож на котировку
     */
    virtual domain::Quote read(const std::filesystem::path& path) = 0;
};

} // namespace quotedesk::ports::output
