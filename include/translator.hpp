#ifndef COLORMORSE_TRANSLATOR_HPP
#define COLORMORSE_TRANSLATOR_HPP

#include <string>

#include "morse_table.hpp"
#include "symbol_stream.hpp"

namespace colormorse {

/// Symbol stream -> text.
///
/// Words split at WordGap, letters at SymbolGap. Codes missing from the
/// table become empty letters; translation never fails.
class Translator {
public:
    static std::string translate(const SymbolStream& symbols,
                                 const MorseTable& table = MorseTable::standard());
};

} // namespace colormorse

#endif // COLORMORSE_TRANSLATOR_HPP
