#include "table_renderer.hpp"
#include <algorithm>
#include <utility>

TableRenderer::TableRenderer(std::vector<std::string> headers) : headers_(std::move(headers)) {}

void TableRenderer::addRow(std::vector<std::string> row) {
    row.resize(headers_.size());
    rows_.push_back(std::move(row));
}

namespace {

// East Asian Wide and Fullwidth blocks, plus the common emoji planes.
bool isWide(char32_t cp) {
    return (cp >= 0x1100 && cp <= 0x115f) ||
           (cp >= 0x2e80 && cp <= 0x303e) ||
           (cp >= 0x3041 && cp <= 0x33ff) ||
           (cp >= 0x3400 && cp <= 0x4dbf) ||
           (cp >= 0x4e00 && cp <= 0x9fff) ||
           (cp >= 0xa000 && cp <= 0xa4cf) ||
           (cp >= 0xac00 && cp <= 0xd7a3) ||
           (cp >= 0xf900 && cp <= 0xfaff) ||
           (cp >= 0xfe30 && cp <= 0xfe4f) ||
           (cp >= 0xff00 && cp <= 0xff60) ||
           (cp >= 0xffe0 && cp <= 0xffe6) ||
           (cp >= 0x1f300 && cp <= 0x1f64f) ||
           (cp >= 0x1f900 && cp <= 0x1f9ff) ||
           (cp >= 0x20000 && cp <= 0x3fffd);
}

}

std::size_t TableRenderer::displayWidth(const std::string& text) {
    std::size_t width = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0x1b && i + 1 < text.size() && text[i + 1] == '[') {
            // CSI sequence ends with a byte in 0x40..0x7E
            i += 2;
            while (i < text.size() && (static_cast<unsigned char>(text[i]) < 0x40 ||
                                       static_cast<unsigned char>(text[i]) > 0x7e)) {
                ++i;
            }
            ++i;
            continue;
        }

        std::size_t length = 1;
        char32_t cp = c;
        if (c >= 0xf0) {
            length = 4;
            cp = c & 0x07;
        } else if (c >= 0xe0) {
            length = 3;
            cp = c & 0x0f;
        } else if (c >= 0xc0) {
            length = 2;
            cp = c & 0x1f;
        }
        for (std::size_t k = 1; k < length && i + k < text.size(); ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3f);
        }

        width += isWide(cp) ? 2 : 1;
        i += length;
    }
    return width;
}

std::vector<std::size_t> TableRenderer::columnWidths() const {
    std::vector<std::size_t> widths;
    for (const auto& header : headers_) {
        widths.push_back(displayWidth(header));
    }
    for (const auto& row : rows_) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], displayWidth(row[i]));
        }
    }
    return widths;
}

void TableRenderer::renderBorder(std::ostream& out, const std::vector<std::size_t>& widths,
                                 const char* left, const char* middle, const char* right) const {
    out << left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) out << middle;
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            out << "─";
        }
    }
    out << right << "\n";
}

void TableRenderer::renderRow(std::ostream& out, const std::vector<std::size_t>& widths,
                              const std::vector<std::string>& row) const {
    out << "│";
    for (std::size_t i = 0; i < widths.size(); ++i) {
        out << " " << row[i] << std::string(widths[i] - displayWidth(row[i]), ' ') << " │";
    }
    out << "\n";
}

void TableRenderer::render(std::ostream& out) const {
    std::vector<std::size_t> widths = columnWidths();

    renderBorder(out, widths, "┌", "┬", "┐");
    renderRow(out, widths, headers_);
    renderBorder(out, widths, "├", "┼", "┤");
    for (const auto& row : rows_) {
        renderRow(out, widths, row);
    }
    renderBorder(out, widths, "└", "┴", "┘");
}
