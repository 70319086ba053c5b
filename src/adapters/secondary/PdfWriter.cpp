#include "adapters/secondary/export/PdfWriter.hpp"

#include <zlib.h>

#include <array>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace quotedesk::adapters::secondary {

namespace {

// Ширины Helvetica для ASCII 32..126 (единицы 1/1000 кегля)
constexpr std::array<int, 95> HELVETICA_WIDTHS = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584
};

constexpr int DEFAULT_WIDTH = 556;
constexpr double BOLD_FACTOR = 1.06;

const char* fontKey(PdfWriter::Font font) {
    return font == PdfWriter::Font::BOLD ? "F2" : "F1";
}

} // namespace

PdfWriter::PdfWriter(double pageWidth, double pageHeight, std::string title)
    : pageWidth_(pageWidth)
    , pageHeight_(pageHeight)
    , title_(std::move(title))
{}

void PdfWriter::newPage() {
    pages_.emplace_back();
}

std::ostringstream& PdfWriter::current() {
    if (pages_.empty()) {
        newPage();
    }
    return pages_.back();
}

void PdfWriter::drawText(double x, double y, Font font, double size, const std::string& text) {
    auto& out = current();
    out << "BT\n/" << fontKey(font) << ' ' << number(size) << " Tf\n"
        << number(x) << ' ' << number(y) << " Td\n"
        << '(' << escape(toWinAnsi(text)) << ") Tj\nET\n";
}

void PdfWriter::drawLine(double x1, double y1, double x2, double y2, double width, const Color& color) {
    auto& out = current();
    out << number(color.r) << ' ' << number(color.g) << ' ' << number(color.b) << " RG\n"
        << number(width) << " w\n"
        << number(x1) << ' ' << number(y1) << " m "
        << number(x2) << ' ' << number(y2) << " l S\n";
}

void PdfWriter::fillRect(double x, double y, double w, double h, const Color& color) {
    auto& out = current();
    out << "q\n"
        << number(color.r) << ' ' << number(color.g) << ' ' << number(color.b) << " rg\n"
        << number(x) << ' ' << number(y) << ' ' << number(w) << ' ' << number(h) << " re f\n"
        << "Q\n";
}

std::string PdfWriter::render() const {
    std::vector<std::string> objects;

    // 1: Catalog, 2: Pages, 3-4: шрифты, 5: Info, далее пары (content, page)
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>");
    objects.push_back("<< /Producer (quotedesk) /Title (" + escape(toWinAnsi(title_)) + ") >>");

    std::vector<std::string> contents;
    for (const auto& page : pages_) {
        contents.push_back(page.str());
    }
    if (contents.empty()) {
        contents.emplace_back();
    }

    std::ostringstream kids;
    for (const auto& content : contents) {
        std::string compressed = deflate(content);
        std::ostringstream stream;
        stream << "<< /Length " << compressed.size() << " /Filter /FlateDecode >>\nstream\n"
               << compressed << "\nendstream";
        objects.push_back(stream.str());
        size_t contentId = objects.size();

        std::ostringstream page;
        page << "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 "
             << number(pageWidth_) << ' ' << number(pageHeight_) << "]"
             << " /Resources << /Font << /F1 3 0 R /F2 4 0 R >> >>"
             << " /Contents " << contentId << " 0 R >>";
        objects.push_back(page.str());
        kids << objects.size() << " 0 R ";
    }

    std::ostringstream pagesObject;
    pagesObject << "<< /Type /Pages /Kids [" << kids.str() << "] /Count " << contents.size() << " >>";
    objects[1] = pagesObject.str();

    std::ostringstream file;
    file << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

    std::vector<std::streamoff> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(file.tellp());
        file << (i + 1) << " 0 obj\n" << objects[i] << "\nendobj\n";
    }

    std::streamoff xrefPos = file.tellp();
    file << "xref\n0 " << (objects.size() + 1) << "\n";
    file << "0000000000 65535 f \n";
    for (auto offset : offsets) {
        file << std::setw(10) << std::setfill('0') << offset << " 00000 n \n";
    }
    file << "trailer\n<< /Size " << (objects.size() + 1)
         << " /Root 1 0 R /Info 5 0 R >>\nstartxref\n" << xrefPos << "\n%%EOF\n";

    return file.str();
}

void PdfWriter::write(const std::filesystem::path& path) const {
    std::string data = render();

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

double PdfWriter::textWidth(const std::string& text, Font font, double size) {
    double units = 0.0;
    for (unsigned char c : toWinAnsi(text)) {
        if (c >= 32 && c <= 126) {
            units += HELVETICA_WIDTHS[c - 32];
        } else {
            units += DEFAULT_WIDTH;
        }
    }
    if (font == Font::BOLD) {
        units *= BOLD_FACTOR;
    }
    return units * size / 1000.0;
}

std::string PdfWriter::toWinAnsi(const std::string& utf8) {
    std::string result;
    result.reserve(utf8.size());

    for (size_t i = 0; i < utf8.size();) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        uint32_t codepoint = 0;
        size_t length = 1;

        if (c < 0x80) {
            codepoint = c;
        } else if ((c & 0xE0) == 0xC0) {
            codepoint = c & 0x1F;
            length = 2;
        } else if ((c & 0xF0) == 0xE0) {
            codepoint = c & 0x0F;
            length = 3;
        } else if ((c & 0xF8) == 0xF0) {
            codepoint = c & 0x07;
            length = 4;
        } else {
            result += '?';
            ++i;
            continue;
        }

        if (i + length > utf8.size()) {
            result += '?';
            break;
        }
        for (size_t k = 1; k < length; ++k) {
            codepoint = (codepoint << 6) | (static_cast<unsigned char>(utf8[i + k]) & 0x3F);
        }
        i += length;

        if (codepoint == '\n' || codepoint == '\r' || codepoint == '\t') {
            result += ' ';
        } else if (codepoint < 0x20 || (codepoint >= 0x7F && codepoint < 0xA0) || codepoint > 0xFF) {
            result += '?';
        } else {
            result += static_cast<char>(codepoint);
        }
    }
    return result;
}

bool PdfWriter::compressionAvailable() {
    const char* runtime = zlibVersion();
    if (runtime == nullptr || runtime[0] != ZLIB_VERSION[0]) {
        std::clog << "[PdfWriter] zlib " << (runtime ? runtime : "?")
                  << " does not match headers " << ZLIB_VERSION << std::endl;
        return false;
    }

    // Пробный поток страницы должен сжиматься и распаковываться без потерь
    const std::string sample = "BT\n/F1 9.00 Tf\n54.00 700.00 Td\n(sample) Tj\nET\n";
    std::string compressed;
    try {
        compressed = deflate(sample);
    } catch (const std::runtime_error& e) {
        std::clog << "[PdfWriter] Compression unavailable: " << e.what() << std::endl;
        return false;
    }

    std::string restored(sample.size(), '\0');
    uLongf restoredLength = static_cast<uLongf>(restored.size());
    int rc = uncompress(reinterpret_cast<Bytef*>(restored.data()), &restoredLength,
                        reinterpret_cast<const Bytef*>(compressed.data()),
                        static_cast<uLong>(compressed.size()));
    if (rc != Z_OK || restoredLength != sample.size() || restored != sample) {
        std::clog << "[PdfWriter] zlib round trip failed with code " << rc << std::endl;
        return false;
    }
    return true;
}

std::string PdfWriter::escape(const std::string& winAnsi) {
    std::string result;
    result.reserve(winAnsi.size());
    for (char c : winAnsi) {
        if (c == '(' || c == ')' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string PdfWriter::number(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

std::string PdfWriter::deflate(const std::string& input) {
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::string compressed(bound, '\0');

    int rc = compress2(reinterpret_cast<Bytef*>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()), Z_BEST_SPEED);
    if (rc != Z_OK) {
        throw std::runtime_error("zlib compress2 failed with code " + std::to_string(rc));
    }
    compressed.resize(bound);
    return compressed;
}

} // namespace quotedesk::adapters::secondary
