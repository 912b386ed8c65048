#ifndef OST_EXCEPT_HH
#define OST_EXCEPT_HH 1
#include <stdexcept>
#include <string>

namespace ost {

// Thrown by operations that need at least one key.
class empty_table_error : public std::logic_error {
  public:
    explicit empty_table_error(const std::string& what)
	: std::logic_error(what) {
    }
};

// Thrown when a floor, ceiling or at() lookup has no answer.
class key_not_found_error : public std::runtime_error {
  public:
    explicit key_not_found_error(const std::string& what)
	: std::runtime_error(what) {
    }
};

}
#endif
