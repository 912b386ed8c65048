#include "clp.h"
#include "bst.hh"
#include "textinput.hh"
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <stdlib.h>
#include <string>

static Clp_Option options[] = {
    { "help", 'h', 1000, 0, 0 },
    { "check", 'c', 1001, 0, Clp_Negate },
    { "stats", 's', 1002, 0, Clp_Negate },
    { "tree", 't', 1003, 0, Clp_Negate },
    { "range", 'r', 1004, Clp_ValString, 0 }
};

static void usage() {
    std::cerr << "Usage: ostdemo [OPTIONS] [FILE]\n"
	      << "Assign each whitespace-separated token of FILE (default stdin)\n"
	      << "its position, then print keys in order and in level order.\n\n"
	      << "  -h, --help          Print this message.\n"
	      << "  -c, --check         Verify tree invariants.\n"
	      << "  -s, --stats         Print size and height.\n"
	      << "  -t, --tree          Print the tree shape.\n"
	      << "  -r, --range=LO:HI   Print keys in [LO, HI] and their count.\n";
    exit(1);
}

typedef ost::bst<std::string, int> table_type;

static void print_pairs(const table_type& st, const std::deque<std::string>& keys) {
    for (auto& k : keys)
	std::cout << k << " " << st.at(k) << "\n";
}

int main(int argc, char** argv) {
    Clp_Parser* clp = Clp_NewParser(argc, argv, sizeof(options) / sizeof(options[0]), options);
    bool check = false, stats = false, tree = false;
    std::string range, filename;

    int opt;
    while ((opt = Clp_Next(clp)) != Clp_Done) {
	if (opt == 1000)
	    usage();
	else if (opt == 1001)
	    check = !clp->negated;
	else if (opt == 1002)
	    stats = !clp->negated;
	else if (opt == 1003)
	    tree = !clp->negated;
	else if (opt == 1004)
	    range = clp->val.s;
	else if (opt == Clp_NotOption && filename.empty())
	    filename = clp->vstr;
	else
	    usage();
    }
    Clp_DeleteParser(clp);

    std::string lo, hi;
    if (!range.empty()) {
	std::string::size_type colon = range.find(':');
	if (colon == std::string::npos || colon == 0 || colon + 1 == range.size()) {
	    std::cerr << "ostdemo: --range wants LO:HI, got \"" << range << "\"\n";
	    usage();
	}
	lo = range.substr(0, colon);
	hi = range.substr(colon + 1);
    }

    table_type st;
    try {
	std::unique_ptr<ost::text_input> in(filename.empty()
					    ? new ost::text_input
					    : new ost::text_input(filename));
	for (int i = 0; !in->empty(); ++i)
	    st.put(in->read_string(), i);
    } catch (std::runtime_error& e) {
	std::cerr << "ostdemo: " << e.what() << "\n";
	return 1;
    }

    print_pairs(st, st.keys());
    std::cout << "\n";
    print_pairs(st, st.level_order());

    if (!range.empty()) {
	std::cout << "\n";
	print_pairs(st, st.keys(lo, hi));
	std::cout << "range_size(" << lo << ", " << hi << ") = "
		  << st.range_size(lo, hi) << "\n";
    }
    if (stats)
	std::cerr << "size " << st.size() << ", height " << st.height() << "\n";
    if (tree)
	std::cerr << st;
    if (check) {
	if (!st.check()) {
	    std::cerr << "ostdemo: symbol table check failed\n";
	    return 1;
	}
	std::cerr << "check ok\n";
    }
    return 0;
}
