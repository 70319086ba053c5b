#pragma once

#include <stdexcept>
#include <string>

namespace quotedesk::domain {

/**
 * @brief Базовое исключение приложения
 */
class QuoteDeskError : public std::runtime_error {
public:
    explicit QuoteDeskError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Повреждённый или отсутствующий JSON с котировками
 */
class ParseError : public QuoteDeskError {
public:
    explicit ParseError(const std::string& message)
        : QuoteDeskError(message) {}
};

/**
 * @brief Некорректный ввод (количество, цены, индекс строки)
 */
class ValidationError : public QuoteDeskError {
public:
    explicit ValidationError(const std::string& message)
        : QuoteDeskError(message) {}
};

/**
 * @brief Ошибка рендеринга PDF/HTML
 */
class ExportError : public QuoteDeskError {
public:
    explicit ExportError(const std::string& message)
        : QuoteDeskError(message) {}
};

/**
 * @brief Ошибка файловой системы (права, пути)
 */
class FileSystemError : public QuoteDeskError {
public:
    explicit FileSystemError(const std::string& message)
        : QuoteDeskError(message) {}
};

} // namespace quotedesk::domain
