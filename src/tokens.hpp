#pragma once

#include <istream>
#include <string>
#include <stdexcept>

struct token_error : public std::runtime_error {
    token_error(const char* msg) : std::runtime_error(msg) {}
};

// splits command text into whitespace separated words.
// '#' starts a comment running to the end of the line.
struct token_stream {
    enum Token {
        Eof,
        Newline,
        Word,
        Number,
    };
    token_stream(std::istream& src);

    Token next();

    std::string text;

private:
    void fill_text(int ch);
    std::istream& _src;
};
