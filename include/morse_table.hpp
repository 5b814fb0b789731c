#ifndef COLORMORSE_MORSE_TABLE_HPP
#define COLORMORSE_MORSE_TABLE_HPP

#include <cstddef>
#include <string>
#include <unordered_map>

namespace colormorse {

/// Immutable Morse pattern (e.g. ".-") -> character lookup.
class MorseTable {
public:
    /// Shared table with letters A-Z, digits 0-9 and a few punctuation marks.
    static const MorseTable& standard();

    /// Character for `code`, or '\0' if the code is not in the table.
    char lookup(const std::string& code) const;

    bool contains(const std::string& code) const { return table_.count(code) != 0; }
    std::size_t size() const noexcept { return table_.size(); }

private:
    MorseTable();

    std::unordered_map<std::string, char> table_;
};

} // namespace colormorse

#endif // COLORMORSE_MORSE_TABLE_HPP
