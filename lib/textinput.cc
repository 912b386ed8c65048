#include "textinput.hh"
#include <errno.h>
#include <limits.h>
#include <stdexcept>
#include <stdlib.h>

namespace ost {

text_input::text_input()
    : in_(&std::cin) {
}

text_input::text_input(std::istream& in)
    : in_(&in) {
}

text_input::text_input(const std::string& filename)
    : file_(filename.c_str()), in_(&file_) {
    if (!file_)
	throw std::runtime_error("text_input: cannot open " + filename);
}

bool text_input::empty() {
    *in_ >> std::ws;
    return in_->peek() == std::char_traits<char>::eof();
}

std::string text_input::read_string() {
    std::string token;
    if (!(*in_ >> token))
	throw std::runtime_error("text_input: no more tokens");
    return token;
}

int text_input::read_int() {
    std::string token = read_string();
    char* end;
    errno = 0;
    long x = strtol(token.c_str(), &end, 10);
    if (*end || end == token.c_str() || errno == ERANGE
	|| x < INT_MIN || x > INT_MAX)
	throw std::invalid_argument("text_input: \"" + token + "\" is not an int");
    return int(x);
}

std::vector<std::string> text_input::read_all_strings() {
    std::vector<std::string> tokens;
    std::string token;
    while (*in_ >> token)
	tokens.push_back(token);
    return tokens;
}

}
