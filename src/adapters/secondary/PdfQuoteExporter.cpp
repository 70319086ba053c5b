#include "adapters/secondary/export/PdfQuoteExporter.hpp"
#include "domain/Errors.hpp"

#include <array>
#include <iostream>
#include <sstream>

namespace quotedesk::adapters::secondary {

namespace {

constexpr double PAGE_WIDTH = 612.0;    // 8.5in
constexpr double PAGE_HEIGHT = 792.0;   // 11in
constexpr double MARGIN = 54.0;
constexpr double TOP = PAGE_HEIGHT - 42.0;
constexpr double ROW_HEIGHT = 16.0;
constexpr double CELL_PADDING = 3.0;
constexpr double FONT_SIZE = 9.0;
constexpr double NOTE_LINE_HEIGHT = 13.0;

// No, Part, Description, Qty, Unit, Line: в сумме PAGE_WIDTH - 2 * MARGIN
constexpr std::array<double, QuoteReport::COLUMN_COUNT> COLUMN_WIDTHS = {
    28.0, 90.0, 196.0, 40.0, 75.0, 75.0
};

enum class Align { LEFT, CENTER, RIGHT };

constexpr std::array<Align, QuoteReport::COLUMN_COUNT> COLUMN_ALIGN = {
    Align::CENTER, Align::LEFT, Align::LEFT, Align::RIGHT, Align::RIGHT, Align::RIGHT
};

const PdfWriter::Color BLACK{0.0, 0.0, 0.0};
const PdfWriter::Color GRID{0.5, 0.5, 0.5};
const PdfWriter::Color HEADER_FILL{0.83, 0.83, 0.83};

} // namespace

PdfQuoteExporter::PdfQuoteExporter(std::shared_ptr<settings::ExportSettings> settings)
    : settings_(std::move(settings))
{}

bool PdfQuoteExporter::isAvailable() {
    return PdfWriter::compressionAvailable();
}

void PdfQuoteExporter::exportQuote(const domain::Quote& quote, const std::filesystem::path& path) {
    try {
        PdfWriter pdf = render(quote);
        pdf.write(path);
        std::clog << "[PdfQuoteExporter] Exported quote " << quote.id << " to " << path
                  << " (" << pdf.pageCount() << " pages)" << std::endl;

    } catch (const domain::ExportError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[PdfQuoteExporter] Export failed: " << e.what() << std::endl;
        throw domain::ExportError("PDF export failed: " + std::string(e.what()));
    }
}

PdfWriter PdfQuoteExporter::render(const domain::Quote& quote) const {
    QuoteReport report = QuoteReport::build(quote, *settings_);

    PdfWriter pdf(PAGE_WIDTH, PAGE_HEIGHT, report.heading);
    pdf.newPage();
    double y = drawPageHeader(pdf, report, true);
    // Шапка таблицы и хотя бы одна строка под ней
    if (y - 2 * ROW_HEIGHT < MARGIN) {
        pdf.newPage();
        y = drawPageHeader(pdf, report, false);
    }
    y = drawRow(pdf, report.header, y, PdfWriter::Font::BOLD, true);

    for (const auto& row : report.rows) {
        // Строка не помещается выше нижнего поля
        if (y - ROW_HEIGHT < MARGIN) {
            pdf.newPage();
            y = drawPageHeader(pdf, report, false);
            y = drawRow(pdf, report.header, y, PdfWriter::Font::BOLD, true);
        }
        y = drawRow(pdf, row, y, PdfWriter::Font::REGULAR, false);
    }

    if (y - ROW_HEIGHT < MARGIN) {
        pdf.newPage();
        y = drawPageHeader(pdf, report, false);
    }
    QuoteReport::Row totalRow{"", "", "", "", report.totalLabel, report.total};
    drawRow(pdf, totalRow, y, PdfWriter::Font::BOLD, false);

    return pdf;
}

double PdfQuoteExporter::drawTitle(PdfWriter& pdf, const QuoteReport& report) const {
    double y = TOP;
    pdf.drawText(MARGIN, y, PdfWriter::Font::BOLD, 16.0, report.title);
    y -= 25.0;
    pdf.drawText(MARGIN, y, PdfWriter::Font::BOLD, 14.0, report.heading);
    y -= 22.0;

    if (report.poNumber) {
        pdf.drawText(MARGIN, y, PdfWriter::Font::REGULAR, 10.0, "PO#: " + *report.poNumber);
        y -= 14.0;
    }
    return y;
}

double PdfQuoteExporter::drawPageHeader(PdfWriter& pdf, const QuoteReport& report, bool firstPage) const {
    double y = drawTitle(pdf, report);

    if (firstPage) {
        pdf.drawText(MARGIN, y, PdfWriter::Font::REGULAR, 10.0, "Date: " + report.date);
        y -= 14.0;

        if (!report.notes.empty()) {
            double width = PAGE_WIDTH - 2 * MARGIN;
            for (const auto& line : wrapText(report.notes, PdfWriter::Font::REGULAR, 10.0, width)) {
                // Длинные заметки продолжаются на следующей странице
                if (y - NOTE_LINE_HEIGHT < MARGIN) {
                    pdf.newPage();
                    y = drawTitle(pdf, report);
                }
                pdf.drawText(MARGIN, y, PdfWriter::Font::REGULAR, 10.0, line);
                y -= NOTE_LINE_HEIGHT;
            }
        }
    }

    return y - 10.0;
}

double PdfQuoteExporter::drawRow(PdfWriter& pdf, const QuoteReport::Row& row, double y,
                                 PdfWriter::Font font, bool shaded) const {
    const double bottom = y - ROW_HEIGHT;
    const double right = PAGE_WIDTH - MARGIN;

    if (shaded) {
        pdf.fillRect(MARGIN, bottom, right - MARGIN, ROW_HEIGHT, HEADER_FILL);
    }

    double x = MARGIN;
    for (size_t col = 0; col < QuoteReport::COLUMN_COUNT; ++col) {
        double width = COLUMN_WIDTHS[col];
        std::string text = fitText(row[col], font, FONT_SIZE, width - 2 * CELL_PADDING);

        double textX = x + CELL_PADDING;
        double textWidth = PdfWriter::textWidth(text, font, FONT_SIZE);
        if (COLUMN_ALIGN[col] == Align::RIGHT) {
            textX = x + width - CELL_PADDING - textWidth;
        } else if (COLUMN_ALIGN[col] == Align::CENTER) {
            textX = x + (width - textWidth) / 2.0;
        }

        if (!text.empty()) {
            pdf.drawText(textX, bottom + 4.5, font, FONT_SIZE, text);
        }
        pdf.drawLine(x, y, x, bottom, 0.25, GRID);
        x += width;
    }
    pdf.drawLine(right, y, right, bottom, 0.25, GRID);
    pdf.drawLine(MARGIN, y, right, y, 0.25, GRID);
    pdf.drawLine(MARGIN, bottom, right, bottom, 0.25, GRID);

    return bottom;
}

std::string PdfQuoteExporter::fitText(const std::string& text, PdfWriter::Font font, double size, double width) {
    if (PdfWriter::textWidth(text, font, size) <= width) {
        return text;
    }

    std::string narrow = text;
    const std::string ellipsis = "...";
    while (!narrow.empty() && PdfWriter::textWidth(narrow + ellipsis, font, size) > width) {
        // Снимаем символ UTF-8 целиком: продолжения 10xxxxxx и ведущий байт
        while (!narrow.empty() && (static_cast<unsigned char>(narrow.back()) & 0xC0) == 0x80) {
            narrow.pop_back();
        }
        if (!narrow.empty()) {
            narrow.pop_back();
        }
    }
    return narrow.empty() ? "" : narrow + ellipsis;
}

std::vector<std::string> PdfQuoteExporter::wrapText(const std::string& text, PdfWriter::Font font,
                                                    double size, double width) {
    std::vector<std::string> lines;
    std::istringstream paragraphs(text);
    std::string paragraph;

    while (std::getline(paragraphs, paragraph)) {
        std::istringstream words(paragraph);
        std::string word;
        std::string line;
        while (words >> word) {
            std::string candidate = line.empty() ? word : line + " " + word;
            if (!line.empty() && PdfWriter::textWidth(candidate, font, size) > width) {
                lines.push_back(line);
                line = word;
            } else {
                line = candidate;
            }
        }
        lines.push_back(fitText(line, font, size, width));
    }
    return lines;
}

} // namespace quotedesk::adapters::secondary
