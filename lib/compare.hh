#ifndef OST_COMPARE_HH
#define OST_COMPARE_HH 1
#include <string.h>
#include <type_traits>
#include <utility>
#include <boost/optional.hpp>

namespace ost {

template <typename T>
inline int default_compare(const T& a, const T& b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

template <typename T>
struct default_comparator {
    inline int operator()(const T& a, const T& b) const {
	return default_compare(a, b);
    }
};

struct cstring_comparator {
    inline int operator()(const char* a, const char* b) const {
	return strcmp(a, b);
    }
};

// Whether a key value stands for "no key". Keyed table operations reject
// null keys before touching the tree.
template <typename K>
struct key_traits {
    static inline bool is_null(const K&) {
	return false;
    }
};

template <typename T>
struct key_traits<T*> {
    static inline bool is_null(T* k) {
	return !k;
    }
};

template <typename T>
struct key_traits<boost::optional<T> > {
    static inline bool is_null(const boost::optional<T>& k) {
	return !k;
    }
};

namespace cmppriv {
template <typename C, typename Ret> class comparator;

// Adapts a less-than predicate.
template <typename C>
class comparator<C, bool> {
  public:
    inline comparator(const C& comp)
	: comp_(comp) {
    }
    template <typename A, typename B>
    inline int compare(const A& a, const B& b) const {
	return comp_(a, b) ? -1 : comp_(b, a);
    }
    inline const C& get() const {
	return comp_;
    }
  private:
    C comp_;
};

template <typename C>
class comparator<C, int> {
  public:
    inline comparator(const C& comp)
	: comp_(comp) {
    }
    template <typename A, typename B>
    inline int compare(const A& a, const B& b) const {
	auto c = comp_(a, b);
	return (c > 0) - (c < 0);
    }
    inline const C& get() const {
	return comp_;
    }
  private:
    C comp_;
};
} // namespace cmppriv

// Three-way wrapper around either a comparator returning a signed number
// (only its sign is used) or a bool-returning strict weak ordering such as
// std::less.
template <typename K, typename C>
struct three_way {
    typedef decltype(std::declval<const C&>()(std::declval<const K&>(),
					      std::declval<const K&>())) result_type;
    static_assert(std::is_arithmetic<typename std::decay<result_type>::type>::value,
		  "comparator must return bool or a signed number");
    typedef cmppriv::comparator<C, typename std::conditional<
	std::is_same<typename std::decay<result_type>::type, bool>::value, bool, int>::type> type;
};

} // namespace ost
#endif
