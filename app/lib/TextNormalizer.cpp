#include "TextNormalizer.hpp"
#include "LineTokenizer.hpp"

#include <cstddef>
#include <optional>

namespace {

std::optional<std::size_t> last_non_blank_index(const std::vector<Line>& lines)
{
    for (std::size_t i = lines.size(); i > 0; --i) {
        if (!lines[i - 1].content.empty()) {
            return i - 1;
        }
    }
    return std::nullopt;
}

LineTerminator nearest_terminator_before(const std::vector<Line>& lines, std::size_t index)
{
    for (std::size_t i = index; i > 0; --i) {
        if (lines[i - 1].terminator != LineTerminator::None) {
            return lines[i - 1].terminator;
        }
    }
    return LineTerminator::Lf;
}

} // namespace


NormalizationResult TextNormalizer::normalize(std::string_view content,
                                              const NormalizationConfig& config)
{
    std::vector<Line> lines = LineTokenizer::tokenize(content);
    for (auto& line : lines) {
        line.content = strip_trailing_whitespace(line.content);
    }

    if (config.eof_newline_normalization && !lines.empty()) {
        collapse_trailing_blank_lines(lines);
    }

    NormalizationResult result;
    result.content = LineTokenizer::join(lines);
    result.changed = result.content != content;
    return result;
}


bool TextNormalizer::is_trailing_whitespace(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\v' || ch == '\f' || ch == '\r';
}


std::string_view TextNormalizer::strip_trailing_whitespace(std::string_view content)
{
    std::size_t end = content.size();
    while (end > 0 && is_trailing_whitespace(content[end - 1])) {
        --end;
    }
    return content.substr(0, end);
}


void TextNormalizer::collapse_trailing_blank_lines(std::vector<Line>& lines)
{
    const auto last = last_non_blank_index(lines);
    if (!last) {
        // Blank-only file: keep a single empty line, in the first line's style when it had one.
        const LineTerminator terminator = lines.front().terminator != LineTerminator::None
            ? lines.front().terminator
            : LineTerminator::Lf;
        lines.assign(1, Line{std::string_view{}, terminator});
        return;
    }

    lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(*last + 1), lines.end());
    Line& final_line = lines.back();
    if (final_line.terminator == LineTerminator::None) {
        final_line.terminator = nearest_terminator_before(lines, *last);
    }
}
