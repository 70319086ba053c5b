#include "QuoteDeskApp.hpp"

// Ports
#include "ports/input/IQuoteService.hpp"
#include "ports/input/IPurchaseListService.hpp"
#include "ports/output/IQuoteStorage.hpp"
#include "ports/output/IQuoteArchive.hpp"
#include "ports/output/IQuoteExporter.hpp"

// Application
#include "application/QuoteService.hpp"
#include "application/PurchaseListService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/JsonFileQuoteStorage.hpp"
#include "adapters/secondary/persistence/JsonQuoteArchive.hpp"
#include "adapters/secondary/export/QuoteExporterFactory.hpp"

// Primary Adapters
#include "adapters/primary/QuoteHandler.hpp"
#include "adapters/primary/LineItemHandler.hpp"
#include "adapters/primary/SupplierHandler.hpp"
#include "adapters/primary/ExportHandler.hpp"
#include "adapters/primary/PurchaseListHandler.hpp"
#include "adapters/primary/HelpHandler.hpp"

#include <boost/di.hpp>
#include <filesystem>

namespace di = boost::di;

namespace quotedesk {

QuoteDeskApp::QuoteDeskApp(std::ostream& out, std::ostream& err)
    : CommandLineApplication(out, err)
{
    std::clog << "[QuoteDeskApp] Initializing..." << std::endl;
}

QuoteDeskApp::~QuoteDeskApp() {
    std::clog << "[QuoteDeskApp] Shutting down..." << std::endl;
}

void QuoteDeskApp::loadEnvironment(int argc, char* argv[]) {
    CommandLineApplication::loadEnvironment(argc, argv);

    auto storage = settings::StorageSettings::fromEnvironment();
    if (auto file = request_.getOption("file")) {
        // Явный файл: без подстановки встроенных котировок
        storage = settings::StorageSettings(*file);
    }

    storageSettings_ = std::make_shared<settings::StorageSettings>(storage);
    exportSettings_ = std::make_shared<settings::ExportSettings>(settings::ExportSettings::fromEnvironment());
    quoteSettings_ = std::make_shared<settings::QuoteSettings>(settings::QuoteSettings::fromEnvironment());

    std::clog << "[QuoteDeskApp] Quotes file: " << storageSettings_->getQuotesFile().string()
              << ", export backend: " << settings::toString(exportSettings_->getBackend()) << std::endl;
}

void QuoteDeskApp::configureInjection() {
    std::clog << "[QuoteDeskApp] Configuring DI..." << std::endl;

    // Шаг 1: выбор экспортёра (один раз за запуск)
    std::shared_ptr<ports::output::IQuoteExporter> exporter =
        adapters::secondary::QuoteExporterFactory::create(exportSettings_);

    // Шаг 2: основной injector
    auto injector = di::make_injector(
        di::bind<settings::StorageSettings>().to(storageSettings_),
        di::bind<settings::ExportSettings>().to(exportSettings_),
        di::bind<settings::QuoteSettings>().to(quoteSettings_),

        di::bind<ports::output::IQuoteStorage>().to<adapters::secondary::JsonFileQuoteStorage>().in(di::singleton),
        di::bind<ports::output::IQuoteArchive>().to<adapters::secondary::JsonQuoteArchive>().in(di::singleton),
        di::bind<ports::output::IQuoteExporter>().to(exporter),

        di::bind<ports::input::IQuoteService>().to<application::QuoteService>().in(di::singleton),
        di::bind<ports::input::IPurchaseListService>().to<application::PurchaseListService>().in(di::singleton));

    // Шаг 3: handlers по именам команд
    handlers_["help"] = injector.create<std::shared_ptr<adapters::primary::HelpHandler>>();
    handlers_["purchase-list"] = injector.create<std::shared_ptr<adapters::primary::PurchaseListHandler>>();

    // Команды над сохранёнными котировками загружают коллекцию
    const std::string& command = request_.getCommand();
    if (command.empty() || command == "help" || command == "purchase-list") {
        std::clog << "[QuoteDeskApp] Ready" << std::endl;
        return;
    }

    auto quoteHandler = injector.create<std::shared_ptr<adapters::primary::QuoteHandler>>();
    for (const char* name : {"list", "show", "new", "set", "delete"}) {
        handlers_[name] = quoteHandler;
    }

    auto lineItemHandler = injector.create<std::shared_ptr<adapters::primary::LineItemHandler>>();
    for (const char* name : {"add-item", "edit-item", "remove-item"}) {
        handlers_[name] = lineItemHandler;
    }

    handlers_["suppliers"] = injector.create<std::shared_ptr<adapters::primary::SupplierHandler>>();

    auto exportHandler = injector.create<std::shared_ptr<adapters::primary::ExportHandler>>();
    for (const char* name : {"export", "export-json", "import-json"}) {
        handlers_[name] = exportHandler;
    }

    // Повреждённый файл: работаем с пустой коллекцией, но предупреждаем.
    // Отсутствующий файл - обычный первый запуск.
    auto quoteService = injector.create<std::shared_ptr<ports::input::IQuoteService>>();
    if (auto warning = quoteService->loadWarning()) {
        if (std::filesystem::exists(storageSettings_->getQuotesFile())) {
            err_ << "Warning: " << *warning << "\n"
                 << "Starting with an empty quote list; saving will overwrite the file.\n";
        }
    }

    std::clog << "[QuoteDeskApp] Ready (exporter: " << exporter->name() << ")" << std::endl;
}

} // namespace quotedesk
