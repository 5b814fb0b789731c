#include "translator.hpp"

namespace colormorse {

namespace {

void flush_letter(std::string& code, std::string& word, const MorseTable& table) {
    if (code.empty()) return;
    // Unknown codes become empty letters.
    char c = table.lookup(code);
    if (c != '\0') word += c;
    code.clear();
}

} // namespace

std::string Translator::translate(const SymbolStream& symbols, const MorseTable& table) {
    // Trim leading and trailing gaps.
    std::size_t first = 0;
    std::size_t last  = symbols.size();
    while (first < last && is_gap(symbols[first])) ++first;
    while (last > first && is_gap(symbols[last - 1])) --last;

    std::string text;
    std::string word;
    std::string code;   // dots and dashes of the letter being built

    for (std::size_t i = first; i < last; ++i) {
        switch (symbols[i]) {
            case Symbol::Dot:  code += '.'; break;
            case Symbol::Dash: code += '-'; break;
            case Symbol::SymbolGap:
                flush_letter(code, word, table);
                break;
            case Symbol::WordGap:
                flush_letter(code, word, table);
                if (!word.empty()) {
                    if (!text.empty()) text += ' ';
                    text += word;
                    word.clear();
                }
                break;
        }
    }
    flush_letter(code, word, table);
    if (!word.empty()) {
        if (!text.empty()) text += ' ';
        text += word;
    }

    return text;
}

} // namespace colormorse
