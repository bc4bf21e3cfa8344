#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

// Bordered text table. Cells may carry ANSI colors and UTF-8 glyphs; column
// widths are measured in terminal columns, wide CJK and emoji glyphs
// counting as two. Combining marks and zero-width characters are not special-cased.
class TableRenderer {
public:
    explicit TableRenderer(std::vector<std::string> headers);

    // Short rows are padded with empty cells, extra cells are dropped.
    void addRow(std::vector<std::string> row);

    void render(std::ostream& out) const;

    std::size_t rowCount() const { return rows_.size(); }

    static std::size_t displayWidth(const std::string& text);

private:
    std::vector<std::size_t> columnWidths() const;
    void renderBorder(std::ostream& out, const std::vector<std::size_t>& widths,
                      const char* left, const char* middle, const char* right) const;
    void renderRow(std::ostream& out, const std::vector<std::size_t>& widths,
                   const std::vector<std::string>& row) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};
