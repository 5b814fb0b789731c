#ifndef COLORMORSE_SYMBOL_STREAM_HPP
#define COLORMORSE_SYMBOL_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colormorse {

/// Discrete Morse units produced by the classifier.
enum class Symbol : uint8_t {
    Dot,
    Dash,
    SymbolGap,   // between letters
    WordGap      // between words
};

inline bool is_gap(Symbol s) noexcept {
    return s == Symbol::SymbolGap || s == Symbol::WordGap;
}

/// Ordered, append-only sequence of symbols for one decoding session.
class SymbolStream {
public:
    SymbolStream() = default;

    void append(Symbol s) { symbols_.push_back(s); }
    void append(Symbol s, std::size_t count) { symbols_.insert(symbols_.end(), count, s); }

    /// Number of consecutive gap symbols at the end of the stream.
    std::size_t trailing_gap_run() const noexcept;

    std::size_t size() const noexcept { return symbols_.size(); }
    bool empty() const noexcept { return symbols_.empty(); }
    Symbol operator[](std::size_t i) const { return symbols_[i]; }

    const std::vector<Symbol>& symbols() const noexcept { return symbols_; }
    auto begin() const noexcept { return symbols_.begin(); }
    auto end() const noexcept { return symbols_.end(); }

    bool operator==(const SymbolStream& other) const { return symbols_ == other.symbols_; }
    bool operator!=(const SymbolStream& other) const { return symbols_ != other.symbols_; }

private:
    std::vector<Symbol> symbols_;
};

/// Render as '.', '-', ' ' (symbol gap) and '|' (word gap).
std::string to_code_string(const SymbolStream& symbols);

/// Inverse of to_code_string(). Returns nullopt on any other character.
std::optional<SymbolStream> parse_code_string(std::string_view text);

/// Words for an announcer: "dot", "dash", "word gap". Symbol gaps become
/// a comma pause.
std::string to_spoken(const SymbolStream& symbols);

} // namespace colormorse

#endif // COLORMORSE_SYMBOL_STREAM_HPP
