#include "morse_table.hpp"

namespace colormorse {

namespace {

struct Entry {
    const char* code;
    char        ch;
};

constexpr Entry kEntries[] = {
    // Letters A-Z
    {".-", 'A'},   {"-...", 'B'}, {"-.-.", 'C'}, {"-..", 'D'},  {".", 'E'},
    {"..-.", 'F'}, {"--.", 'G'},  {"....", 'H'}, {"..", 'I'},   {".---", 'J'},
    {"-.-", 'K'},  {".-..", 'L'}, {"--", 'M'},   {"-.", 'N'},   {"---", 'O'},
    {".--.", 'P'}, {"--.-", 'Q'}, {".-.", 'R'},  {"...", 'S'},  {"-", 'T'},
    {"..-", 'U'},  {"...-", 'V'}, {".--", 'W'},  {"-..-", 'X'}, {"-.--", 'Y'},
    {"--..", 'Z'},
    // Digits 0-9
    {"-----", '0'}, {".----", '1'}, {"..---", '2'}, {"...--", '3'},
    {"....-", '4'}, {".....", '5'}, {"-....", '6'}, {"--...", '7'},
    {"---..", '8'}, {"----.", '9'},
    // Punctuation
    {".-.-.-", '.'}, {"--..--", ','}, {"..--..", '?'}, {"-..-.", '/'},
    {"---...", ':'}, {"-....-", '-'}, {".-.-.", '+'},  {"-...-", '='},
};

} // namespace

MorseTable::MorseTable() {
    table_.reserve(sizeof(kEntries) / sizeof(kEntries[0]));
    for (const auto& e : kEntries) {
        table_.emplace(e.code, e.ch);
    }
}

const MorseTable& MorseTable::standard() {
    static const MorseTable table;
    return table;
}

char MorseTable::lookup(const std::string& code) const {
    auto it = table_.find(code);
    return it != table_.end() ? it->second : '\0';
}

} // namespace colormorse
