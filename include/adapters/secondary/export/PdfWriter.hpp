#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace quotedesk::adapters::secondary {

/**
 * @brief Минимальный писатель PDF 1.4
 *
 * Страницы из текста (Helvetica/Helvetica-Bold, WinAnsiEncoding),
 * линий и залитых прямоугольников. Потоки страниц сжимаются zlib
 * (FlateDecode). Координаты в пунктах, начало в левом нижнем углу.
 */
class PdfWriter {
public:
    enum class Font {
        REGULAR,
        BOLD
    };

    struct Color {
        double r = 0.0;
        double g = 0.0;
        double b = 0.0;
    };

    PdfWriter(double pageWidth, double pageHeight, std::string title = "");

    void newPage();

    void drawText(double x, double y, Font font, double size, const std::string& text);

    void drawLine(double x1, double y1, double x2, double y2, double width, const Color& color);

    void fillRect(double x, double y, double w, double h, const Color& color);

    size_t pageCount() const { return pages_.size(); }
    double pageWidth() const { return pageWidth_; }
    double pageHeight() const { return pageHeight_; }

    /**
     * @brief Собрать файл целиком
     * @throws std::runtime_error если не удалось сжать поток
     */
    std::string render() const;

    /**
     * @throws std::runtime_error при ошибке сжатия или записи
     */
    void write(const std::filesystem::path& path) const;

    /**
     * @brief Ширина строки в пунктах по метрикам Helvetica
     */
    static double textWidth(const std::string& text, Font font, double size);

    /**
     * @brief UTF-8 -> WinAnsi, символы вне Latin-1 заменяются на '?'
     */
    static std::string toWinAnsi(const std::string& utf8);

    /**
     * @brief Работает ли сжатие потоков в загруженной zlib
     *
     * Версия совпадает с заголовками сборки, и пробный поток
     * проходит compress2/uncompress без потерь.
     */
    static bool compressionAvailable();

private:
    double pageWidth_;
    double pageHeight_;
    std::string title_;
    std::vector<std::ostringstream> pages_;

    std::ostringstream& current();

    static std::string escape(const std::string& winAnsi);
    static std::string number(double value);
    static std::string deflate(const std::string& input);
};

} // namespace quotedesk::adapters::secondary
