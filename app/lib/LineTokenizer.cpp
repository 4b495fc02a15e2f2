#include "LineTokenizer.hpp"


std::vector<Line> LineTokenizer::tokenize(std::string_view text)
{
    std::vector<Line> lines;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\n') {
            continue;
        }
        if (i > start && text[i - 1] == '\r') {
            lines.push_back(Line{text.substr(start, i - 1 - start), LineTerminator::CrLf});
        } else {
            lines.push_back(Line{text.substr(start, i - start), LineTerminator::Lf});
        }
        start = i + 1;
    }
    if (start < text.size()) {
        lines.push_back(Line{text.substr(start), LineTerminator::None});
    }
    return lines;
}


std::string LineTokenizer::join(const std::vector<Line>& lines)
{
    std::size_t total = 0;
    for (const auto& line : lines) {
        total += line.content.size() + to_string(line.terminator).size();
    }

    std::string result;
    result.reserve(total);
    for (const auto& line : lines) {
        result.append(line.content);
        result.append(to_string(line.terminator));
    }
    return result;
}


std::size_t LineTokenizer::count_terminators(std::string_view text)
{
    std::size_t count = 0;
    for (char ch : text) {
        if (ch == '\n') {
            ++count;
        }
    }
    return count;
}
