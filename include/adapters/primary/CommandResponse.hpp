#pragma once

#include <sstream>
#include <string>

namespace quotedesk::adapters::primary {

/**
 * @brief Коды завершения CLI
 */
enum ExitCode {
    EXIT_OK = 0,
    EXIT_INVALID = 1,      ///< ошибка ввода или использования
    EXIT_NO_QUOTES = 2,    ///< нет файла котировок (purchase-list)
    EXIT_IO_ERROR = 3      ///< ошибка файловой системы или экспорта
};

/**
 * @brief Результат выполнения команды
 *
 * Обработчики пишут вывод в out()/err(), приложение затем
 * копирует его в stdout/stderr и возвращает exitCode().
 */
class CommandResponse {
public:
    std::ostream& out() { return out_; }
    std::ostream& err() { return err_; }

    std::string getOutput() const { return out_.str(); }
    std::string getError() const { return err_.str(); }

    int getExitCode() const { return exitCode_; }
    void setExitCode(int code) { exitCode_ = code; }

    void setError(int code, const std::string& message) {
        exitCode_ = code;
        err_ << "Error: " << message << "\n";
    }

private:
    std::ostringstream out_;
    std::ostringstream err_;
    int exitCode_ = EXIT_OK;
};

} // namespace quotedesk::adapters::primary
