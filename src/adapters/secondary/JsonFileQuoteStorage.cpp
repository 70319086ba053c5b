#include "adapters/secondary/persistence/JsonFileQuoteStorage.hpp"
#include "adapters/secondary/json/QuoteJson.hpp"
#include "domain/Errors.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdlib.h>

namespace quotedesk::adapters::secondary {

JsonFileQuoteStorage::JsonFileQuoteStorage(std::shared_ptr<settings::StorageSettings> settings)
    : settings_(std::move(settings))
{
    std::clog << "[JsonFileQuoteStorage] Using " << settings_->getQuotesFile() << std::endl;
}

std::vector<domain::Quote> JsonFileQuoteStorage::load() {
    const auto& userFile = settings_->getQuotesFile();
    try {
        auto quotes = readFile(userFile);
        std::clog << "[JsonFileQuoteStorage] Loaded " << quotes.size()
                  << " quotes from " << userFile << std::endl;
        return quotes;

    } catch (const domain::ParseError& e) {
        // Встроенный файл только вместо отсутствующего файла пользователя
        const auto& bundled = settings_->getBundledQuotesFile();
        std::error_code ec;
        if (!bundled || std::filesystem::exists(userFile, ec)) {
            throw;
        }

        std::clog << "[JsonFileQuoteStorage] User quotes not available (" << e.what()
                  << "), trying bundled " << *bundled << std::endl;
        try {
            auto quotes = readFile(*bundled);
            std::clog << "[JsonFileQuoteStorage] Loaded " << quotes.size()
                      << " bundled quotes" << std::endl;
            return quotes;
        } catch (const domain::ParseError& bundledError) {
            std::clog << "[JsonFileQuoteStorage] Bundled quotes not available: "
                      << bundledError.what() << std::endl;
            throw domain::ParseError(e.what());
        }
    }
}

void JsonFileQuoteStorage::save(const std::vector<domain::Quote>& quotes) {
    const auto& path = settings_->getQuotesFile();
    writeFileAtomically(path, QuoteJson::toJson(quotes).dump(4));
    std::clog << "[JsonFileQuoteStorage] Saved " << quotes.size()
              << " quotes to " << path << std::endl;
}

std::vector<domain::Quote> JsonFileQuoteStorage::readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw domain::ParseError("Cannot open quotes file " + path.string());
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::ParseError("Malformed JSON in " + path.string() + ": " + e.what());
    }

    try {
        return QuoteJson::listFromJson(j);
    } catch (const domain::ParseError& e) {
        throw domain::ParseError(path.string() + ": " + e.what());
    }
}

void JsonFileQuoteStorage::writeFileAtomically(const std::filesystem::path& path,
                                               const std::string& content) {
    namespace fs = std::filesystem;

    fs::path dir = path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw domain::FileSystemError("Cannot create directory " + dir.string() + ": " + ec.message());
    }

    std::string tmpName = (dir / (path.filename().string() + ".XXXXXX")).string();
    int fd = ::mkstemp(tmpName.data());
    if (fd < 0) {
        throw domain::FileSystemError("Cannot create temporary file in " + dir.string() +
                                      ": " + std::strerror(errno));
    }
    ::close(fd);

    fs::path tmpPath(tmpName);
    try {
        std::ofstream out;
        out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
        out.open(tmpPath, std::ios::out | std::ios::trunc);
        out << content;
        out.close();

        fs::rename(tmpPath, path);

    } catch (const std::exception& e) {
        fs::remove(tmpPath, ec);
        throw domain::FileSystemError("Failed to write " + path.string() + ": " + e.what());
    }
}

} // namespace quotedesk::adapters::secondary
