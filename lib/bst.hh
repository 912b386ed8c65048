#ifndef OST_BST_HH
#define OST_BST_HH 1
#include <stdint.h>
#include <algorithm>
#include <deque>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>
#include "compare.hh"
#include "ostassert.hh"
#include "ostexcept.hh"

// Set OST_BST_DEBUG to a nonzero value to run check() after every mutation.
#ifndef OST_BST_DEBUG
# define OST_BST_DEBUG 0
#endif

#if OST_BST_DEBUG
# define ost_bst_postcondition() mandatory_assert(check(), "symbol table invariants")
#else
# define ost_bst_postcondition() do { } while (0)
#endif

namespace ost {

// Ordered symbol table: an unbalanced binary search tree with subtree
// counts, so rank, select and range counts run in O(height).
//
// Nodes live in a dense arena and refer to their children by handle.
// Mutating walks return the (possibly new) root handle of the subtree
// they were given and the caller stores it back into its own link.
// Discarding a node moves the last arena slot into the hole, so the
// arena always holds exactly size() nodes.
//
// Keys are unique under Compare, which may return an int (three-way) or
// a bool (strict weak ordering). Deletion is Hibbard deletion; the tree
// is never rebalanced.
template <typename K, typename V, typename Compare = default_comparator<K> >
class bst {
  public:
    typedef K key_type;
    typedef V mapped_type;
    typedef Compare key_compare;
    typedef uint32_t handle_type;
    static const handle_type nil = handle_type(-1);

    inline bst(const key_compare& compare = key_compare());

    inline bool empty() const;
    inline size_t size() const;
    inline key_compare key_comp() const;

    inline boost::optional<V> get(const K& key) const;
    inline const V& at(const K& key) const;
    inline bool contains(const K& key) const;

    void put(const K& key, const V& value);
    void put(const K& key, const boost::optional<V>& value);
    void remove(const K& key);
    void delete_min();
    void delete_max();
    void clear();

    inline const K& min() const;
    inline const K& max() const;
    const K& floor(const K& key) const;
    const K& ceiling(const K& key) const;
    const K& select(int k) const;
    int rank(const K& key) const;
    int range_size(const K& lo, const K& hi) const;

    std::deque<K> keys() const;
    std::deque<K> keys(const K& lo, const K& hi) const;
    std::deque<K> level_order() const;
    int height() const;

    bool check() const;

    inline void swap(bst<K, V, Compare>& x);

    template <typename KK, typename VV, typename CC>
    friend std::ostream& operator<<(std::ostream& s, const bst<KK, VV, CC>& tree);

  private:
    struct node {
	K key;
	V value;
	handle_type c_[2];
	int count;

	inline node(const K& k, const V& v)
	    : key(k), value(v), count(1) {
	    c_[0] = c_[1] = nil;
	}
    };
    typedef typename three_way<K, Compare>::type comparator_type;

    std::vector<node> n_;
    handle_type root_;
    comparator_type comp_;

    inline int compare(const K& a, const K& b) const;
    inline int size(handle_type x) const;
    inline void recount(handle_type x);
    inline void check_key(const K& key, const char* op) const;
    inline void check_nonempty(const char* op) const;
    inline handle_type find_node(const K& key) const;
    inline handle_type edge_node(handle_type x, bool isright) const;

    handle_type put_node(handle_type x, const K& key, const V& value);
    handle_type remove_node(handle_type x, const K& key, handle_type& victim);
    handle_type delete_edge(handle_type x, bool isright, handle_type& victim);
    void release(handle_type x);
    handle_type bound_node(handle_type x, const K& key, bool up) const;
    void collect(handle_type x, std::deque<K>& q, const K& lo, const K& hi) const;
    int height(handle_type x) const;

    bool is_bst(handle_type x, const K* lo, const K* hi) const;
    bool is_size_consistent(handle_type x) const;
    bool is_rank_consistent() const;
    void output(std::ostream& s, handle_type x, int indent) const;
};

template <typename K, typename V, typename C>
const typename bst<K, V, C>::handle_type bst<K, V, C>::nil;

template <typename K, typename V, typename C>
inline bst<K, V, C>::bst(const key_compare& compare)
    : root_(nil), comp_(compare) {
}

template <typename K, typename V, typename C>
inline int bst<K, V, C>::compare(const K& a, const K& b) const {
    return comp_.compare(a, b);
}

template <typename K, typename V, typename C>
inline int bst<K, V, C>::size(handle_type x) const {
    return x == nil ? 0 : n_[x].count;
}

template <typename K, typename V, typename C>
inline void bst<K, V, C>::recount(handle_type x) {
    n_[x].count = 1 + size(n_[x].c_[0]) + size(n_[x].c_[1]);
}

template <typename K, typename V, typename C>
inline void bst<K, V, C>::check_key(const K& key, const char* op) const {
    if (key_traits<K>::is_null(key))
	throw std::invalid_argument(std::string("bst::") + op + ": null key");
}

template <typename K, typename V, typename C>
inline void bst<K, V, C>::check_nonempty(const char* op) const {
    if (root_ == nil)
	throw empty_table_error(std::string("bst::") + op + ": empty symbol table");
}

template <typename K, typename V, typename C>
inline bool bst<K, V, C>::empty() const {
    return root_ == nil;
}

template <typename K, typename V, typename C>
inline size_t bst<K, V, C>::size() const {
    return size(root_);
}

template <typename K, typename V, typename C>
inline auto bst<K, V, C>::key_comp() const -> key_compare {
    return comp_.get();
}

template <typename K, typename V, typename C>
inline auto bst<K, V, C>::find_node(const K& key) const -> handle_type {
    handle_type x = root_;
    while (x != nil) {
	int cmp = compare(key, n_[x].key);
	if (cmp == 0)
	    break;
	x = n_[x].c_[cmp > 0];
    }
    return x;
}

template <typename K, typename V, typename C>
inline auto bst<K, V, C>::edge_node(handle_type x, bool isright) const -> handle_type {
    while (n_[x].c_[isright] != nil)
	x = n_[x].c_[isright];
    return x;
}

template <typename K, typename V, typename C>
inline boost::optional<V> bst<K, V, C>::get(const K& key) const {
    check_key(key, "get");
    handle_type x = find_node(key);
    if (x == nil)
	return boost::none;
    return n_[x].value;
}

template <typename K, typename V, typename C>
inline const V& bst<K, V, C>::at(const K& key) const {
    check_key(key, "at");
    handle_type x = find_node(key);
    if (x == nil)
	throw key_not_found_error("bst::at: key not in symbol table");
    return n_[x].value;
}

template <typename K, typename V, typename C>
inline bool bst<K, V, C>::contains(const K& key) const {
    return !!get(key);
}

template <typename K, typename V, typename C>
auto bst<K, V, C>::put_node(handle_type x, const K& key, const V& value) -> handle_type {
    if (x == nil) {
	mandatory_assert(n_.size() < size_t(nil));
	n_.push_back(node(key, value));
	return handle_type(n_.size() - 1);
    }
    int cmp = compare(key, n_[x].key);
    if (cmp == 0)
	n_[x].value = value;
    else {
	// put_node may grow the arena; don't hold a reference across it
	handle_type c = put_node(n_[x].c_[cmp > 0], key, value);
	n_[x].c_[cmp > 0] = c;
    }
    recount(x);
    return x;
}

template <typename K, typename V, typename C>
void bst<K, V, C>::put(const K& key, const V& value) {
    check_key(key, "put");
    root_ = put_node(root_, key, value);
    ost_bst_postcondition();
}

template <typename K, typename V, typename C>
void bst<K, V, C>::put(const K& key, const boost::optional<V>& value) {
    check_key(key, "put");
    if (!value)
	remove(key);
    else
	put(key, *value);
}

template <typename K, typename V, typename C>
auto bst<K, V, C>::delete_edge(handle_type x, bool isright, handle_type& victim) -> handle_type {
    if (n_[x].c_[isright] == nil) {
	victim = x;
	return n_[x].c_[!isright];
    }
    handle_type c = delete_edge(n_[x].c_[isright], isright, victim);
    n_[x].c_[isright] = c;
    recount(x);
    return x;
}

template <typename K, typename V, typename C>
auto bst<K, V, C>::remove_node(handle_type x, const K& key, handle_type& victim) -> handle_type {
    if (x == nil)
	return nil;
    int cmp = compare(key, n_[x].key);
    if (cmp != 0) {
	handle_type c = remove_node(n_[x].c_[cmp > 0], key, victim);
	n_[x].c_[cmp > 0] = c;
    } else {
	victim = x;
	if (n_[x].c_[1] == nil)
	    return n_[x].c_[0];
	if (n_[x].c_[0] == nil)
	    return n_[x].c_[1];
	// Hibbard: the right subtree's minimum takes x's place
	handle_type t = x, unlinked = nil;
	x = edge_node(n_[t].c_[1], false);
	n_[x].c_[1] = delete_edge(n_[t].c_[1], false, unlinked);
	n_[x].c_[0] = n_[t].c_[0];
	assert(unlinked == x);
    }
    recount(x);
    return x;
}

// Drop the unlinked node x from the arena. The last slot moves into x,
// and the single link that pointed at it is found by key and rewritten.
template <typename K, typename V, typename C>
void bst<K, V, C>::release(handle_type x) {
    handle_type last = handle_type(n_.size() - 1);
    if (x != last) {
	handle_type* link = &root_;
	while (*link != last) {
	    mandatory_assert(*link != nil);
	    int cmp = compare(n_[last].key, n_[*link].key);
	    link = &n_[*link].c_[cmp > 0];
	}
	n_[x] = std::move(n_[last]);
	*link = x;
    }
    n_.pop_back();
}

template <typename K, typename V, typename C>
void bst<K, V, C>::remove(const K& key) {
    check_key(key, "remove");
    if (root_ == nil)
	return;
    if (n_[root_].count == 1) {
	if (compare(key, n_[root_].key) == 0) {
	    n_.clear();
	    root_ = nil;
	}
	return;
    }
    handle_type victim = nil;
    root_ = remove_node(root_, key, victim);
    if (victim != nil)
	release(victim);
    ost_bst_postcondition();
}

template <typename K, typename V, typename C>
void bst<K, V, C>::delete_min() {
    check_nonempty("delete_min");
    handle_type victim = nil;
    root_ = delete_edge(root_, false, victim);
    release(victim);
    ost_bst_postcondition();
}

template <typename K, typename V, typename C>
void bst<K, V, C>::delete_max() {
    check_nonempty("delete_max");
    handle_type victim = nil;
    root_ = delete_edge(root_, true, victim);
    release(victim);
    ost_bst_postcondition();
}

template <typename K, typename V, typename C>
void bst<K, V, C>::clear() {
    while (root_ != nil)
	delete_min();
}

template <typename K, typename V, typename C>
inline const K& bst<K, V, C>::min() const {
    check_nonempty("min");
    return n_[edge_node(root_, false)].key;
}

template <typename K, typename V, typename C>
inline const K& bst<K, V, C>::max() const {
    check_nonempty("max");
    return n_[edge_node(root_, true)].key;
}

// Closest node to key on the low side (floor) or the high side (ceiling).
template <typename K, typename V, typename C>
auto bst<K, V, C>::bound_node(handle_type x, const K& key, bool up) const -> handle_type {
    if (x == nil)
	return nil;
    int cmp = compare(key, n_[x].key);
    if (cmp == 0)
	return x;
    if ((cmp > 0) == up)
	return bound_node(n_[x].c_[up], key, up);
    handle_type t = bound_node(n_[x].c_[!up], key, up);
    return t != nil ? t : x;
}

template <typename K, typename V, typename C>
const K& bst<K, V, C>::floor(const K& key) const {
    check_key(key, "floor");
    check_nonempty("floor");
    handle_type x = bound_node(root_, key, false);
    if (x == nil)
	throw key_not_found_error("bst::floor: no key at or below the argument");
    return n_[x].key;
}

template <typename K, typename V, typename C>
const K& bst<K, V, C>::ceiling(const K& key) const {
    check_key(key, "ceiling");
    check_nonempty("ceiling");
    handle_type x = bound_node(root_, key, true);
    if (x == nil)
	throw key_not_found_error("bst::ceiling: no key at or above the argument");
    return n_[x].key;
}

template <typename K, typename V, typename C>
const K& bst<K, V, C>::select(int k) const {
    if (k < 0 || k >= size(root_))
	throw std::out_of_range("bst::select: index out of range");
    handle_type x = root_;
    while (1) {
	int t = size(n_[x].c_[0]);
	if (t > k)
	    x = n_[x].c_[0];
	else if (t < k) {
	    k -= t + 1;
	    x = n_[x].c_[1];
	} else
	    return n_[x].key;
    }
}

template <typename K, typename V, typename C>
int bst<K, V, C>::rank(const K& key) const {
    check_key(key, "rank");
    int r = 0;
    handle_type x = root_;
    while (x != nil) {
	int cmp = compare(key, n_[x].key);
	if (cmp < 0)
	    x = n_[x].c_[0];
	else {
	    r += size(n_[x].c_[0]);
	    if (cmp == 0)
		break;
	    ++r;
	    x = n_[x].c_[1];
	}
    }
    return r;
}

template <typename K, typename V, typename C>
int bst<K, V, C>::range_size(const K& lo, const K& hi) const {
    check_key(lo, "range_size");
    check_key(hi, "range_size");
    if (compare(lo, hi) > 0)
	return 0;
    int n = rank(hi) - rank(lo);
    return find_node(hi) != nil ? n + 1 : n;
}

template <typename K, typename V, typename C>
void bst<K, V, C>::collect(handle_type x, std::deque<K>& q,
			   const K& lo, const K& hi) const {
    if (x == nil)
	return;
    int cmplo = compare(lo, n_[x].key);
    int cmphi = compare(hi, n_[x].key);
    if (cmplo < 0)
	collect(n_[x].c_[0], q, lo, hi);
    if (cmplo <= 0 && cmphi >= 0)
	q.push_back(n_[x].key);
    if (cmphi > 0)
	collect(n_[x].c_[1], q, lo, hi);
}

template <typename K, typename V, typename C>
std::deque<K> bst<K, V, C>::keys(const K& lo, const K& hi) const {
    check_key(lo, "keys");
    check_key(hi, "keys");
    std::deque<K> q;
    collect(root_, q, lo, hi);
    return q;
}

template <typename K, typename V, typename C>
std::deque<K> bst<K, V, C>::keys() const {
    if (root_ == nil)
	return std::deque<K>();
    return keys(min(), max());
}

template <typename K, typename V, typename C>
std::deque<K> bst<K, V, C>::level_order() const {
    std::deque<K> keys;
    std::deque<handle_type> q;
    q.push_back(root_);
    while (!q.empty()) {
	handle_type x = q.front();
	q.pop_front();
	if (x == nil)
	    continue;
	keys.push_back(n_[x].key);
	q.push_back(n_[x].c_[0]);
	q.push_back(n_[x].c_[1]);
    }
    return keys;
}

template <typename K, typename V, typename C>
int bst<K, V, C>::height(handle_type x) const {
    if (x == nil)
	return -1;
    return 1 + std::max(height(n_[x].c_[0]), height(n_[x].c_[1]));
}

template <typename K, typename V, typename C>
int bst<K, V, C>::height() const {
    return height(root_);
}

template <typename K, typename V, typename C>
inline void bst<K, V, C>::swap(bst<K, V, C>& x) {
    using std::swap;
    swap(n_, x.n_);
    swap(root_, x.root_);
    swap(comp_, x.comp_);
}

template <typename K, typename V, typename C>
inline void swap(bst<K, V, C>& a, bst<K, V, C>& b) {
    a.swap(b);
}

// Strict order also rules out shared subtrees and cycles.
template <typename K, typename V, typename C>
bool bst<K, V, C>::is_bst(handle_type x, const K* lo, const K* hi) const {
    if (x == nil)
	return true;
    if (lo && compare(n_[x].key, *lo) <= 0)
	return false;
    if (hi && compare(n_[x].key, *hi) >= 0)
	return false;
    return is_bst(n_[x].c_[0], lo, &n_[x].key)
	&& is_bst(n_[x].c_[1], &n_[x].key, hi);
}

template <typename K, typename V, typename C>
bool bst<K, V, C>::is_size_consistent(handle_type x) const {
    if (x == nil)
	return true;
    if (n_[x].count != 1 + size(n_[x].c_[0]) + size(n_[x].c_[1]))
	return false;
    return is_size_consistent(n_[x].c_[0]) && is_size_consistent(n_[x].c_[1]);
}

template <typename K, typename V, typename C>
bool bst<K, V, C>::is_rank_consistent() const {
    int n = size(root_);
    for (int i = 0; i < n; ++i)
	if (rank(select(i)) != i)
	    return false;
    for (const K& key : keys()) {
	int r = rank(key);
	if (r < 0 || r >= n || compare(select(r), key) != 0)
	    return false;
    }
    return true;
}

template <typename K, typename V, typename C>
bool bst<K, V, C>::check() const {
    bool ok = true;
    if (!is_bst(root_, 0, 0)) {
	std::cerr << "bst: not in symmetric order\n";
	ok = false;
    }
    if (!is_size_consistent(root_)) {
	std::cerr << "bst: subtree counts not consistent\n";
	ok = false;
    }
    if (size_t(size(root_)) != n_.size()) {
	std::cerr << "bst: " << n_.size() << " arena nodes for "
		  << size(root_) << " keys\n";
	ok = false;
    }
    if (ok && !is_rank_consistent()) {
	std::cerr << "bst: ranks not consistent\n";
	ok = false;
    }
    return ok;
}

template <typename K, typename V, typename C>
void bst<K, V, C>::output(std::ostream& s, handle_type x, int indent) const {
    const node& n = n_[x];
    if (n.c_[0] != nil)
	output(s, n.c_[0], indent + 2);
    s << std::setw(indent) << "" << n.key << " #" << n.count << "\n";
    if (n.c_[1] != nil)
	output(s, n.c_[1], indent + 2);
}

template <typename K, typename V, typename C>
std::ostream& operator<<(std::ostream& s, const bst<K, V, C>& tree) {
    if (tree.root_ == bst<K, V, C>::nil)
	s << "<empty>\n";
    else
	tree.output(s, tree.root_, 0);
    return s;
}

} // namespace ost

#undef ost_bst_postcondition
#endif
