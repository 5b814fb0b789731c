#include "symbol_stream.hpp"

namespace colormorse {

std::size_t SymbolStream::trailing_gap_run() const noexcept {
    std::size_t run = 0;
    for (auto it = symbols_.rbegin(); it != symbols_.rend() && is_gap(*it); ++it) {
        ++run;
    }
    return run;
}

std::string to_code_string(const SymbolStream& symbols) {
    std::string out;
    out.reserve(symbols.size());
    for (Symbol s : symbols) {
        switch (s) {
            case Symbol::Dot:       out += '.'; break;
            case Symbol::Dash:      out += '-'; break;
            case Symbol::SymbolGap: out += ' '; break;
            case Symbol::WordGap:   out += '|'; break;
        }
    }
    return out;
}

std::optional<SymbolStream> parse_code_string(std::string_view text) {
    SymbolStream symbols;
    for (char c : text) {
        switch (c) {
            case '.': symbols.append(Symbol::Dot);       break;
            case '-': symbols.append(Symbol::Dash);      break;
            case ' ': symbols.append(Symbol::SymbolGap); break;
            case '|': symbols.append(Symbol::WordGap);   break;
            default:  return std::nullopt;
        }
    }
    return symbols;
}

std::string to_spoken(const SymbolStream& symbols) {
    std::string out;
    for (Symbol s : symbols) {
        if (s == Symbol::SymbolGap) {
            if (!out.empty() && out.back() != ',') out += ',';
            continue;
        }
        if (!out.empty()) out += ' ';
        switch (s) {
            case Symbol::Dot:     out += "dot";      break;
            case Symbol::Dash:    out += "dash";     break;
            case Symbol::WordGap: out += "word gap"; break;
            case Symbol::SymbolGap: break;
        }
    }
    return out;
}

} // namespace colormorse
