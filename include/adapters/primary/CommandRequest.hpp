#pragma once

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace quotedesk::adapters::primary {

/**
 * @brief Разобранная командная строка: команда, позиционные аргументы, опции
 *
 * Формат: quotedesk <command> [args...] [--option value]... [--flag]
 * Опция может повторяться (--exempt A --exempt B).
 */
class CommandRequest {
public:
    CommandRequest() = default;

    explicit CommandRequest(std::string command)
        : command_(std::move(command)) {}

    /**
     * @brief Разобрать argv (argv[0] пропускается)
     *
     * @throws std::invalid_argument если у опции нет значения
     */
    static CommandRequest parse(int argc, char* argv[]) {
        std::vector<std::string> tokens;
        for (int i = 1; i < argc; ++i) {
            tokens.emplace_back(argv[i]);
        }
        return parse(tokens);
    }

    static CommandRequest parse(const std::vector<std::string>& tokens) {
        CommandRequest req;
        for (size_t i = 0; i < tokens.size(); ++i) {
            const std::string& token = tokens[i];

            if (token.size() > 2 && token.compare(0, 2, "--") == 0) {
                std::string name = token.substr(2);
                std::string value;

                auto eq = name.find('=');
                if (eq != std::string::npos) {
                    value = name.substr(eq + 1);
                    name = name.substr(0, eq);
                } else if (isFlag(name)) {
                    value = "true";
                } else {
                    if (i + 1 >= tokens.size()) {
                        throw std::invalid_argument("Option --" + name + " requires a value");
                    }
                    value = tokens[++i];
                }
                req.options_.emplace(name, value);
            } else if (req.command_.empty()) {
                req.command_ = token;
            } else {
                req.args_.push_back(token);
            }
        }
        return req;
    }

    const std::string& getCommand() const { return command_; }
    const std::vector<std::string>& getArgs() const { return args_; }

    std::optional<std::string> getArg(size_t index) const {
        if (index >= args_.size()) return std::nullopt;
        return args_[index];
    }

    /**
     * @brief Последнее значение опции
     */
    std::optional<std::string> getOption(const std::string& name) const {
        auto range = options_.equal_range(name);
        if (range.first == range.second) return std::nullopt;
        return std::prev(range.second)->second;
    }

    std::vector<std::string> getOptions(const std::string& name) const {
        std::vector<std::string> values;
        auto range = options_.equal_range(name);
        for (auto it = range.first; it != range.second; ++it) {
            values.push_back(it->second);
        }
        return values;
    }

    bool hasOption(const std::string& name) const {
        return options_.count(name) > 0;
    }

    void addArg(const std::string& value) { args_.push_back(value); }
    void setOption(const std::string& name, const std::string& value) { options_.emplace(name, value); }

private:
    std::string command_;
    std::vector<std::string> args_;
    std::multimap<std::string, std::string> options_;

    // Опции без значения
    static bool isFlag(const std::string& name) {
        static const std::set<std::string> flags = {"json", "help", "clear"};
        return flags.count(name) > 0;
    }
};

} // namespace quotedesk::adapters::primary
