#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <stdexcept>

namespace quotedesk::domain {

/**
 * @brief Временная метка (UTC, точность до секунды)
 *
 * Секундная точность нужна, чтобы toString()/fromString() давали
 * то же самое значение после сохранения в файл.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Парсинг ISO 8601
     *
     * Понимает "2025-12-18T10:20:30Z" и "2025-12-18T10:20:30.123456+03:00".
     * Дробная часть секунд отбрасывается, смещение пересчитывается в UTC.
     *
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            // Дата без времени: "2025-12-18"
            ss.clear();
            ss.str(str);
            tm = {};
            ss >> std::get_time(&tm, "%Y-%m-%d");
            if (ss.fail()) {
                throw std::invalid_argument("Invalid timestamp: " + str);
            }
        }

        std::string rest;
        std::getline(ss, rest);

        size_t pos = 0;
        if (pos < rest.size() && rest[pos] == '.') {
            ++pos;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
                ++pos;
            }
        }

        long offsetSeconds = 0;
        if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
            int sign = rest[pos] == '-' ? -1 : 1;
            std::string hh = rest.substr(pos + 1, 2);
            std::string mm = rest.size() >= pos + 6 ? rest.substr(pos + 4, 2) : "00";
            try {
                offsetSeconds = sign * (std::stol(hh) * 3600 + std::stol(mm) * 60);
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid timestamp offset: " + str);
            }
        }

        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
        return Timestamp(tp - std::chrono::seconds(offsetSeconds));
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Только дата: "2025-12-18"
     */
    std::string toDateString() const {
        return toString().substr(0, 10);
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }

    bool operator!=(const Timestamp& other) const {
        return value != other.value;
    }

private:
    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::seconds>(tp);
    }
};

} // namespace quotedesk::domain
