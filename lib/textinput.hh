#ifndef OST_TEXTINPUT_HH
#define OST_TEXTINPUT_HH 1
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace ost {

// Whitespace-delimited tokens from a file or an existing stream.
class text_input {
  public:
    text_input();
    explicit text_input(std::istream& in);
    explicit text_input(const std::string& filename);

    bool empty();
    std::string read_string();
    int read_int();
    std::vector<std::string> read_all_strings();

  private:
    std::ifstream file_;
    std::istream* in_;

    text_input(const text_input&) = delete;
    text_input& operator=(const text_input&) = delete;
};

}
#endif
