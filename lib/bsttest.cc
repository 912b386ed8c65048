#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <map>
#include <vector>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <boost/random.hpp>
#include <boost/random/random_number_generator.hpp>
#include "bst.hh"
#include <sys/time.h>
#include <sys/resource.h>

typedef boost::random_number_generator<boost::mt19937> random_index;

// Drives one table through a timed workload. With print set, the table
// is dumped between phases instead of being queried silently.
struct bst_driver {
    ost::bst<int, int> tree;
    bool print;

    explicit bst_driver(bool p)
	: print(p) {
    }
    inline void insert(int val) {
	tree.put(val, val);
    }
    inline void find(int val) {
	mandatory_assert(tree.contains(val) == (val < int(tree.size())));
    }
    // select and rank must invert each other; the range [k, k + 15]
    // holds 16 keys unless it runs off the end.
    inline void order(int i) {
	int n = int(tree.size());
	const int& k = tree.select(i % n);
	mandatory_assert(tree.rank(k) == i % n);
	mandatory_assert(tree.range_size(k, k + 15) == std::min(16, n - k));
    }
    inline void erase(int val) {
	tree.remove(val);
    }
    void phase(const char* name) {
	if (print)
	    std::cerr << name << ":\n" << tree << "\n";
	else
	    std::cerr << name << ": size " << tree.size()
		      << ", height " << tree.height() << "\n";
    }
};

static void print_time(const char* what, const struct rusage& a, const struct rusage& b) {
    struct timeval tv;
    timersub(&b.ru_utime, &a.ru_utime, &tv);
    fprintf(stderr, "  %s %ld.%06ld", what, long(tv.tv_sec), long(tv.tv_usec));
}

// Inserts keys 0..N-1 in random order, looks up and order-queries them,
// then removes them all in a fresh random order.
template <typename D>
void grow_and_shrink(D& driver, int N) {
    boost::mt19937 gen;
    random_index rng(gen);
    std::vector<int> keys(N);
    for (int i = 0; i < N; ++i)
	keys[i] = i;
    struct rusage ru[8];

    std::random_shuffle(keys.begin(), keys.end(), rng);
    getrusage(RUSAGE_SELF, &ru[0]);
    for (int k : keys)
	driver.insert(k);
    getrusage(RUSAGE_SELF, &ru[1]);
    driver.phase("grown");

    getrusage(RUSAGE_SELF, &ru[2]);
    for (int i = 0; i < 4 * N; ++i)
	driver.find(rng(2 * N));
    getrusage(RUSAGE_SELF, &ru[3]);

    getrusage(RUSAGE_SELF, &ru[4]);
    for (int i = 0; i < N; ++i)
	driver.order(rng(N));
    getrusage(RUSAGE_SELF, &ru[5]);

    std::random_shuffle(keys.begin(), keys.end(), rng);
    getrusage(RUSAGE_SELF, &ru[6]);
    for (int k : keys)
	driver.erase(k);
    getrusage(RUSAGE_SELF, &ru[7]);
    driver.phase("shrunk");

    fprintf(stderr, "time:");
    print_time("insert", ru[0], ru[1]);
    print_time("find", ru[2], ru[3]);
    print_time("order", ru[4], ru[5]);
    print_time("remove", ru[6], ru[7]);
    fprintf(stderr, "\n");
    mandatory_assert(driver.tree.empty() && driver.tree.check());
}

// Random operation stream checked against std::map; the table's own
// check() runs after every step.
void fuzz(int N) {
    boost::mt19937 gen;
    random_index rng(gen);
    const int SZ = 512;
    ost::bst<int, int> tree;
    std::map<int, int> in;
    for (int i = 0; i < N; ++i) {
	int op = rng(16), which = rng(SZ);
	if (op < 5) {
	    auto v = tree.get(which);
	    auto it = in.find(which);
	    mandatory_assert(it == in.end() ? !v : v && *v == it->second);
	} else if (op < 9) {
	    tree.put(which, i);
	    in[which] = i;
	} else if (op < 12) {
	    tree.remove(which);
	    in.erase(which);
	} else if (op == 12 && !in.empty()) {
	    mandatory_assert(tree.min() == in.begin()->first);
	    tree.delete_min();
	    in.erase(in.begin());
	} else if (op == 13 && !in.empty()) {
	    mandatory_assert(tree.max() == in.rbegin()->first);
	    tree.delete_max();
	    in.erase(std::prev(in.end()));
	} else if (!in.empty()) {
	    int k = rng(int(in.size()));
	    auto it = in.begin();
	    std::advance(it, k);
	    mandatory_assert(tree.select(k) == it->first);
	    mandatory_assert(tree.rank(it->first) == k);
	    int lo = rng(SZ), hi = lo + rng(SZ / 4);
	    mandatory_assert(tree.range_size(lo, hi)
			     == int(std::distance(in.lower_bound(lo), in.upper_bound(hi))));
	}
	mandatory_assert(tree.size() == in.size());
	mandatory_assert(tree.check());
    }
    std::cerr << "fuzz: " << N << " operations, final size " << tree.size()
	      << ", height " << tree.height() << "\n";
}

int main(int argc, char **argv) {
    if (argc > 1 && strcmp(argv[1], "-p") == 0) {
	bst_driver driver(false);
	grow_and_shrink(driver, argc > 2 ? atoi(argv[2]) : 1000000);
	exit(0);
    } else if (argc > 1 && strcmp(argv[1], "-f") == 0) {
	fuzz(argc > 2 ? atoi(argv[2]) : 20000);
	exit(0);
    } else if (argc > 1) {
	fprintf(stderr, "Usage: bsttest [-p [N]|-f [N]]\n");
	exit(1);
    }

    bst_driver driver(true);
    grow_and_shrink(driver, 20);

    ost::bst<int, int> t;
    for (int k : {0, 1, -2, 4, 3, 2})
	t.put(k, k * k);
    std::cerr << t << "\n";
    t.remove(1);
    std::cerr << t << "\n";
    t.put(0, boost::optional<int>());
    std::cerr << t << "\n";
    mandatory_assert(t.check());
}
