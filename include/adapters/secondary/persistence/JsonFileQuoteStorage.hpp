#pragma once

#include "ports/output/IQuoteStorage.hpp"
#include "settings/StorageSettings.hpp"
#include <filesystem>
#include <memory>
#include <vector>

namespace quotedesk::adapters::secondary {

/**
 * @brief Хранилище котировок в одном JSON файле
 *
 * load(): пользовательский файл, при его отсутствии или порче
 * поставляемый с приложением файл по умолчанию (если настроен).
 *
 * save(): вся коллекция пишется во временный файл в том же каталоге,
 * затем rename() поверх старого. При ошибке старый файл не меняется.
 */
class JsonFileQuoteStorage : public ports::output::IQuoteStorage {
public:
    explicit JsonFileQuoteStorage(std::shared_ptr<settings::StorageSettings> settings);

    std::vector<domain::Quote> load() override;

    void save(const std::vector<domain::Quote>& quotes) override;

    /**
     * @brief Прочитать JSON массив котировок из файла
     * @throws domain::ParseError
     */
    static std::vector<domain::Quote> readFile(const std::filesystem::path& path);

    /**
     * @brief Атомарно записать текст в файл (temp + rename)
     * @throws domain::FileSystemError
     */
    static void writeFileAtomically(const std::filesystem::path& path, const std::string& content);

private:
    std::shared_ptr<settings::StorageSettings> settings_;
};

} // namespace quotedesk::adapters::secondary
