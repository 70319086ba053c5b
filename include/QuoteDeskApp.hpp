#pragma once

#include "CommandLineApplication.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/ExportSettings.hpp"
#include "settings/QuoteSettings.hpp"
#include <memory>

namespace quotedesk {

/**
 * @class QuoteDeskApp
 * @brief Приложение управления котировками (CLI)
 *
 * 1. loadEnvironment() - argv + настройки из ENV (--file подменяет файл котировок)
 * 2. configureInjection() - Boost.DI: хранилище, экспорт, сервисы, handlers
 * 3. start() - выполнение команды (из базового класса)
 */
class QuoteDeskApp : public CommandLineApplication {
public:
    QuoteDeskApp(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~QuoteDeskApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    /**
     * @brief Собрать граф объектов и зарегистрировать handlers
     *
     * Экспортёр выбирается один раз здесь (PDF, если доступен, иначе HTML)
     * и передаётся в DI как готовый экземпляр.
     */
    void configureInjection() override;

private:
    std::shared_ptr<settings::StorageSettings> storageSettings_;
    std::shared_ptr<settings::ExportSettings> exportSettings_;
    std::shared_ptr<settings::QuoteSettings> quoteSettings_;
};

} // namespace quotedesk
