#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace quotedesk {

/**
 * @class CommandLineApplication
 * @brief Базовое CLI приложение с Template Method
 *
 * run() вызывает по порядку:
 * 1. loadEnvironment() - разбор argv и загрузка настроек
 * 2. configureInjection() - сборка графа объектов и регистрация handlers
 * 3. start() - выполнение одной команды
 */
class CommandLineApplication {
public:
    CommandLineApplication(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    virtual ~CommandLineApplication() = default;

    /**
     * @return Код завершения процесса
     */
    int run(int argc, char* argv[]);

protected:
    /**
     * @brief Разобрать аргументы командной строки в request_
     *
     * @throws std::invalid_argument при некорректных опциях
     */
    virtual void loadEnvironment(int argc, char* argv[]);

    virtual void configureInjection() = 0;

    /**
     * @brief Найти handler по имени команды и выполнить его
     */
    virtual int start();

    adapters::primary::CommandRequest request_;
    std::map<std::string, std::shared_ptr<adapters::primary::ICommandHandler>> handlers_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace quotedesk
