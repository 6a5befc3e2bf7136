#include "tokens.hpp"

#include <cctype>

token_stream::token_stream(std::istream& src) : _src(src) {
}

token_stream::Token token_stream::next() {
    text = "";

    if (!_src.good())
        return Eof;

    // eat blanks and comments, but not line ends
    int ch = _src.get();
    while ((isspace(ch) && ch != '\n') || ch == '#') {
        while (isspace(ch) && ch != '\n')
            ch = _src.get();
        if (ch == '#') {
            while (ch != '\n' && _src.good())
                ch = _src.get();
        }
    }

    if (ch == '\n')
        return Newline;
    if (!_src.good()) {
        if (_src.bad())
            throw token_error("unable to read command input");
        return Eof;
    }

    fill_text(ch);
    const char* b = text.c_str();
    if ((*b == '-' && isdigit(*(b+1))) || isdigit(*b))
        return Number;
    return Word;
}

void token_stream::fill_text(int ch) {
    while (ch != std::char_traits<char>::eof() && !isspace(ch) && ch != '#') {
        text += (char)ch;
        ch = _src.get();
    }
    if (_src.good())
        _src.unget();
    else
        _src.clear(_src.rdstate() & ~std::ios::failbit);
}
