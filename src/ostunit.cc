#include <boost/random.hpp>
#include <boost/random/random_number_generator.hpp>
#include <boost/optional.hpp>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "bst.hh"
#include "check.hh"
#include "textinput.hh"

namespace {

typedef void (*test_func)();
typedef ost::bst<std::string, int> string_table;

std::string join(const std::deque<std::string>& keys) {
    std::string s;
    for (auto& k : keys) {
	if (!s.empty())
	    s += ' ';
	s += k;
    }
    return s;
}

void load_tiny(string_table& st) {
    const char* tiny[] = {"S", "E", "A", "R", "C", "H", "E",
			  "X", "A", "M", "P", "L", "E"};
    for (int i = 0; i != int(sizeof(tiny) / sizeof(tiny[0])); ++i)
	st.put(tiny[i], i);
}

void test_tiny() {
    string_table st;
    load_tiny(st);
    CHECK_EQ(st.size(), size_t(10));
    CHECK_EQ(join(st.keys()), std::string("A C E H L M P R S X"));
    CHECK_EQ(st.min(), std::string("A"));
    CHECK_EQ(st.max(), std::string("X"));
    CHECK_EQ(st.rank("H"), 3);
    CHECK_EQ(st.select(0), std::string("A"));
    CHECK_EQ(st.floor("D"), std::string("C"));
    CHECK_EQ(st.ceiling("D"), std::string("E"));
    CHECK_EQ(st.range_size("C", "P"), 6);
    CHECK_TRUE(st.check());

    std::pair<const char*, int> values[] = {
	{"A", 8}, {"C", 4}, {"E", 12}, {"H", 5}, {"L", 11},
	{"M", 9}, {"P", 10}, {"R", 3}, {"S", 0}, {"X", 7}
    };
    for (auto& v : values) {
	CHECK_TRUE(st.contains(v.first));
	CHECK_EQ(*st.get(v.first), v.second);
	CHECK_EQ(st.at(v.first), v.second);
    }
}

void test_shape() {
    string_table st;
    load_tiny(st);
    CHECK_EQ(join(st.level_order()), std::string("S E X A R C H M L P"));
    CHECK_EQ(st.height(), 5);

    std::ostringstream s;
    s << st;
    CHECK_EQ(s.str().substr(0, s.str().find('\n')), std::string("    A #2"));
}

void test_empty() {
    string_table st;
    CHECK_TRUE(st.empty());
    CHECK_EQ(st.size(), size_t(0));
    CHECK_EQ(st.height(), -1);
    CHECK_THROWS(st.min(), ost::empty_table_error);
    CHECK_THROWS(st.max(), ost::empty_table_error);
    CHECK_THROWS(st.delete_min(), ost::empty_table_error);
    CHECK_THROWS(st.delete_max(), ost::empty_table_error);
    CHECK_THROWS(st.floor("x"), ost::empty_table_error);
    CHECK_THROWS(st.ceiling("x"), ost::empty_table_error);
    CHECK_THROWS(st.select(0), std::out_of_range);
    CHECK_THROWS(st.at("x"), ost::key_not_found_error);
    CHECK_TRUE(!st.get("x"));
    CHECK_TRUE(!st.contains("x"));
    CHECK_EQ(st.rank("x"), 0);
    CHECK_EQ(st.range_size("a", "z"), 0);
    CHECK_TRUE(st.keys().empty());
    CHECK_TRUE(st.level_order().empty());
    st.remove("x");
    CHECK_TRUE(st.check());

    std::ostringstream s;
    s << st;
    CHECK_EQ(s.str(), std::string("<empty>\n"));
}

void test_delete_root_of_two() {
    string_table st;
    st.put("A", 0);
    st.put("B", 1);
    CHECK_EQ(join(st.level_order()), std::string("A B"));
    st.remove("A");
    CHECK_EQ(st.size(), size_t(1));
    CHECK_EQ(join(st.keys()), std::string("B"));
    CHECK_EQ(st.at("B"), 1);
    CHECK_TRUE(!st.contains("A"));
    CHECK_TRUE(st.check());
}

void test_one_node_remove() {
    string_table st;
    st.put("only", 1);
    st.remove("other");
    CHECK_EQ(st.size(), size_t(1));
    CHECK_TRUE(st.contains("only"));
    st.remove("only");
    CHECK_TRUE(st.empty());
    CHECK_TRUE(st.check());
}

void test_hibbard() {
    string_table st;
    load_tiny(st);
    // E has two children; its successor H takes its place
    st.remove("E");
    CHECK_EQ(join(st.level_order()), std::string("S H X A R C M L P"));
    CHECK_EQ(st.height(), 4);
    CHECK_EQ(join(st.keys()), std::string("A C H L M P R S X"));
    CHECK_EQ(st.at("H"), 5);
    CHECK_EQ(st.rank("H"), 2);
    CHECK_TRUE(st.check());

    // the root, whose successor X is a leaf
    st.remove("S");
    CHECK_EQ(join(st.level_order()), std::string("X H A R C M L P"));
    CHECK_EQ(st.height(), 4);
    CHECK_TRUE(st.check());
}

void test_put_overwrite() {
    string_table st;
    st.put("k", 1);
    st.put("k", 2);
    CHECK_EQ(st.size(), size_t(1));
    CHECK_EQ(*st.get("k"), 2);
}

void test_put_none_deletes() {
    string_table st;
    load_tiny(st);
    st.put("M", boost::optional<int>());
    CHECK_TRUE(!st.contains("M"));
    CHECK_EQ(st.size(), size_t(9));
    st.put("M", boost::optional<int>(40));
    CHECK_EQ(st.at("M"), 40);
    st.put("Q", boost::optional<int>());
    CHECK_EQ(st.size(), size_t(10));
    CHECK_TRUE(st.check());
}

void test_remove_idempotent() {
    string_table st;
    load_tiny(st);
    st.remove("R");
    std::string keys = join(st.keys()), level = join(st.level_order());
    st.remove("R");
    CHECK_EQ(join(st.keys()), keys);
    CHECK_EQ(join(st.level_order()), level);
    CHECK_EQ(st.size(), size_t(9));
    st.remove("Z");
    CHECK_EQ(st.size(), size_t(9));
}

void test_delete_min_max() {
    string_table st;
    load_tiny(st);
    st.delete_min();
    CHECK_EQ(st.min(), std::string("C"));
    st.delete_max();
    CHECK_EQ(st.max(), std::string("S"));
    CHECK_EQ(st.size(), size_t(8));
    CHECK_TRUE(st.check());

    std::vector<std::string> drained;
    while (!st.empty()) {
	drained.push_back(st.max());
	st.delete_max();
	CHECK_TRUE(st.check());
    }
    CHECK_EQ(drained.size(), size_t(8));
    CHECK_EQ(drained.front(), std::string("S"));
    CHECK_EQ(drained.back(), std::string("C"));
}

void test_clear() {
    string_table st;
    load_tiny(st);
    st.clear();
    CHECK_TRUE(st.empty());
    CHECK_EQ(st.height(), -1);
    st.put("again", 1);
    CHECK_EQ(st.size(), size_t(1));
}

void test_floor_ceiling() {
    string_table st;
    load_tiny(st);
    CHECK_EQ(st.floor("E"), std::string("E"));
    CHECK_EQ(st.ceiling("E"), std::string("E"));
    CHECK_EQ(st.floor("Z"), std::string("X"));
    CHECK_EQ(st.ceiling("B"), std::string("C"));
    CHECK_EQ(st.floor("N"), std::string("M"));
    CHECK_EQ(st.ceiling("N"), std::string("P"));
    CHECK_THROWS(st.floor("0"), ost::key_not_found_error);
    CHECK_THROWS(st.ceiling("Y"), ost::key_not_found_error);
}

void test_select_range() {
    string_table st;
    load_tiny(st);
    CHECK_EQ(st.select(9), std::string("X"));
    CHECK_THROWS(st.select(-1), std::out_of_range);
    CHECK_THROWS(st.select(10), std::out_of_range);
    for (int i = 0; i < int(st.size()); ++i)
	CHECK_EQ(st.rank(st.select(i)), i);
    for (auto& k : st.keys())
	CHECK_EQ(st.select(st.rank(k)), k);
}

void test_ranges() {
    string_table st;
    load_tiny(st);
    CHECK_EQ(join(st.keys("C", "P")), std::string("C E H L M P"));
    CHECK_EQ(join(st.keys("D", "Q")), std::string("E H L M P"));
    CHECK_EQ(st.range_size("D", "Q"), 5);
    CHECK_EQ(st.range_size("P", "C"), 0);
    CHECK_TRUE(st.keys("P", "C").empty());
    CHECK_EQ(st.range_size("X", "X"), 1);
    CHECK_EQ(st.range_size("Y", "Z"), 0);
    const char* bounds[] = {"0", "A", "B", "E", "I", "S", "T", "X", "Z"};
    for (auto lo : bounds)
	for (auto hi : bounds)
	    CHECK_EQ(size_t(st.range_size(lo, hi)), st.keys(lo, hi).size());
}

void test_null_keys() {
    ost::bst<const char*, int, ost::cstring_comparator> st;
    st.put("b", 1);
    st.put("a", 2);
    CHECK_THROWS(st.put(nullptr, 3), std::invalid_argument);
    CHECK_THROWS(st.get(nullptr), std::invalid_argument);
    CHECK_THROWS(st.contains(nullptr), std::invalid_argument);
    CHECK_THROWS(st.remove(nullptr), std::invalid_argument);
    CHECK_THROWS(st.rank(nullptr), std::invalid_argument);
    CHECK_THROWS(st.floor(nullptr), std::invalid_argument);
    CHECK_THROWS(st.keys(nullptr, "z"), std::invalid_argument);
    CHECK_THROWS(st.range_size("a", nullptr), std::invalid_argument);
    CHECK_EQ(st.size(), size_t(2));
    CHECK_EQ(std::string(st.min()), std::string("a"));
    // a different pointer with equal contents finds the same key
    std::string b("b");
    CHECK_EQ(st.at(b.c_str()), 1);
    CHECK_TRUE(st.check());
}

void test_bool_comparator() {
    ost::bst<int, std::string, std::greater<int> > st;
    for (int i = 0; i < 10; ++i)
	st.put(i, std::to_string(i));
    CHECK_EQ(st.min(), 9);
    CHECK_EQ(st.max(), 0);
    CHECK_EQ(st.rank(7), 2);
    CHECK_EQ(st.ceiling(20), 9);
    CHECK_EQ(st.floor(-1), 0);
    CHECK_THROWS(st.floor(20), ost::key_not_found_error);
    CHECK_TRUE(st.check());
}

// Orders ints ascending or descending, depending on a flag the caller
// owns, so a test can reverse the order under a filled table.
struct switchable_comparator {
    const bool* descending;
    int operator()(int a, int b) const {
	int c = ost::default_compare(a, b);
	return *descending ? -c : c;
    }
};

void test_check_detects_disorder() {
    bool descending = false;
    switchable_comparator comp = {&descending};
    ost::bst<int, int, switchable_comparator> st(comp);
    for (int k : {5, 2, 8, 1, 3})
	st.put(k, k);
    CHECK_TRUE(st.check());
    descending = true;
    CHECK_TRUE(!st.check());
    descending = false;
    CHECK_TRUE(st.check());
    CHECK_EQ(st.select(0), 1);
}

// Differences of far-apart keys do not fit in an int.
struct difference_comparator {
    long long operator()(long long a, long long b) const {
	return a - b;
    }
};

void test_wide_comparator() {
    ost::bst<long long, int, difference_comparator> st;
    const long long far = 1LL << 33;
    st.put(0, 0);
    st.put(far, 1);
    st.put(-far, 2);
    CHECK_EQ(st.size(), size_t(3));
    CHECK_EQ(st.min(), -far);
    CHECK_EQ(st.max(), far);
    CHECK_EQ(st.at(far), 1);
    CHECK_EQ(st.rank(0), 1);
    CHECK_TRUE(st.check());
}

void test_copy_swap() {
    string_table a;
    load_tiny(a);
    string_table b(a);
    b.remove("S");
    CHECK_EQ(a.size(), size_t(10));
    CHECK_EQ(b.size(), size_t(9));
    string_table c;
    c.put("c", 1);
    swap(a, c);
    CHECK_EQ(a.size(), size_t(1));
    CHECK_EQ(c.size(), size_t(10));
    CHECK_TRUE(a.check() && b.check() && c.check());
}

// Random puts and removes mirrored against std::map.
void test_fuzz() {
    boost::mt19937 gen(2718);
    boost::random_number_generator<boost::mt19937> rng(gen);
    ost::bst<int, int> st;
    std::map<int, int> model;
    for (int i = 0; i < 4000; ++i) {
	int op = rng(10), key = rng(200);
	if (op < 5) {
	    st.put(key, i);
	    model[key] = i;
	} else if (op < 8) {
	    st.remove(key);
	    model.erase(key);
	} else if (op == 8 && !st.empty()) {
	    CHECK_EQ(st.min(), model.begin()->first);
	    st.delete_min();
	    model.erase(model.begin());
	} else if (!st.empty()) {
	    CHECK_EQ(st.max(), model.rbegin()->first);
	    st.delete_max();
	    model.erase(std::prev(model.end()));
	}
	CHECK_EQ(st.size(), model.size());
	auto it = model.lower_bound(key);
	CHECK_EQ(st.rank(key), int(std::distance(model.begin(), it)));
	CHECK_EQ(st.contains(key), it != model.end() && it->first == key);
	if (i % 16 == 0)
	    CHECK_TRUE(st.check());
    }
    std::deque<int> keys = st.keys();
    CHECK_EQ(keys.size(), model.size());
    auto kit = keys.begin();
    for (auto& kv : model) {
	CHECK_EQ(*kit, kv.first);
	CHECK_EQ(st.at(kv.first), kv.second);
	++kit;
    }
}

void test_text_input() {
    std::istringstream s("  S E A\n\tR 42 -7 x1 ");
    ost::text_input in(s);
    CHECK_TRUE(!in.empty());
    CHECK_EQ(in.read_string(), std::string("S"));
    CHECK_EQ(in.read_string(), std::string("E"));
    CHECK_EQ(in.read_string(), std::string("A"));
    CHECK_EQ(in.read_string(), std::string("R"));
    CHECK_EQ(in.read_int(), 42);
    CHECK_EQ(in.read_int(), -7);
    CHECK_THROWS(in.read_int(), std::invalid_argument);
    CHECK_TRUE(in.empty());
    CHECK_THROWS(in.read_string(), std::runtime_error);

    std::istringstream t("a b\nc");
    ost::text_input tin(t);
    CHECK_EQ(tin.read_all_strings().size(), size_t(3));
    CHECK_TRUE(tin.empty());

    CHECK_THROWS(ost::text_input("/nonexistent/ostable/input.txt"), std::runtime_error);
}

} // namespace

int main(int argc, char** argv) {
    std::set<std::string> testcases(argv + 1, argv + argc);
    std::vector<std::pair<std::string, test_func> > tests_;
#define ADD_TEST(test) tests_.push_back(std::pair<std::string, test_func>(#test, test))
    ADD_TEST(test_tiny);
    ADD_TEST(test_shape);
    ADD_TEST(test_empty);
    ADD_TEST(test_delete_root_of_two);
    ADD_TEST(test_one_node_remove);
    ADD_TEST(test_hibbard);
    ADD_TEST(test_put_overwrite);
    ADD_TEST(test_put_none_deletes);
    ADD_TEST(test_remove_idempotent);
    ADD_TEST(test_delete_min_max);
    ADD_TEST(test_clear);
    ADD_TEST(test_floor_ceiling);
    ADD_TEST(test_select_range);
    ADD_TEST(test_ranges);
    ADD_TEST(test_null_keys);
    ADD_TEST(test_bool_comparator);
    ADD_TEST(test_check_detects_disorder);
    ADD_TEST(test_wide_comparator);
    ADD_TEST(test_copy_swap);
    ADD_TEST(test_fuzz);
    ADD_TEST(test_text_input);
    size_t ntests = 0;
    for (auto& t : tests_)
	if (testcases.empty() || testcases.find(t.first) != testcases.end()) {
	    std::cerr << "Testing " << t.first << std::endl;
	    t.second();
	    ++ntests;
	}
    if (ntests)
	std::cerr << "PASS" << std::endl;
    return ntests ? 0 : 1;
}
