#include <algorithm>
#include <cassert>
#include <cstdio>
#include <iostream>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "lexitree.hpp"
#include "utils.hpp"

static constexpr unsigned NUM_ROUNDS = 100;
static constexpr size_t KEY_LEN = 2;
static constexpr size_t NUM_FOUND_SEARCHES = 15;
static constexpr size_t NUM_NOTFOUND_SEARCHES = 5;
static constexpr size_t NUM_NOTFOUND_DELETES = 5;

static void fuzzy_test_round(bool do_inserts, std::mt19937& gen) {
    const std::vector<size_t> max_keys_choices{4, 5, 6, 8};
    size_t max_keys = max_keys_choices[std::uniform_int_distribution<size_t>(
        0, max_keys_choices.size() - 1)(gen)];
    auto* lt = lexitree::Lexitree::Open(max_keys);

    size_t NUM_INSERTS = 0;
    if (do_inserts) {
        std::uniform_int_distribution<size_t> rand_ninserts_small(1, 6 * 2);
        std::uniform_int_distribution<size_t> rand_ninserts_medium(6 * 2 + 1,
                                                                   6 * 6 * 2);
        std::uniform_int_distribution<size_t> rand_ninserts_large(
            6 * 6 * 2 + 1, 6 * 6 * 6 * 3);
        unsigned choice = std::uniform_int_distribution<unsigned>(1, 3)(gen);
        NUM_INSERTS = (choice == 1)   ? rand_ninserts_small(gen)
                      : (choice == 2) ? rand_ninserts_medium(gen)
                                      : rand_ninserts_large(gen);
    }

    std::cout << " MaxKeys=" << max_keys << " "
              << "#inserts=" << NUM_INSERTS << std::endl;

    std::multiset<std::string> refset;
    std::vector<std::string> refvec;

    auto CheckedInsert = [&](std::string key) {
        lt->Insert(key);
        refvec.push_back(key);
        refset.insert(std::move(key));
    };

    auto CheckedSearch = [&](const std::string& key) {
        bool found = lt->Search(key);
        bool reffound = refset.contains(key);
        if (reffound != found) {
            throw TestException("Search mismatch: key=" + key +
                                " found=" + (found ? "T" : "F") +
                                " reffound=" + (reffound ? "T" : "F"));
        }
    };

    auto CheckedDelete = [&](const std::string& key) {
        bool found = lt->Delete(key);
        auto it = refset.find(key);
        bool reffound = it != refset.end();
        if (reffound) refset.erase(it);
        if (reffound != found) {
            throw TestException("Delete mismatch: key=" + key +
                                " found=" + (found ? "T" : "F") +
                                " reffound=" + (reffound ? "T" : "F"));
        }
    };

    auto CheckedContent = [&]() {
        std::vector<std::string> keys = lt->Keys();
        std::vector<std::string> refkeys(refset.begin(), refset.end());
        if (keys != refkeys) {
            throw TestException("Keys mismatch: keys=" + join_keys(keys) +
                                " refkeys=" + join_keys(refkeys));
        }
        if (lt->Size() != refset.size()) {
            throw TestException("Size mismatch: size=" +
                                std::to_string(lt->Size()) + " refsize=" +
                                std::to_string(refset.size()));
        }
        lexitree::BPTreeStats stats = lt->GatherStats();
        check(stats.height == lt->Height(), "Stats height mismatch");
        check(stats.nkeys_leaf == refset.size(), "Stats nkeys_leaf mismatch");
    };

    // inserting random keys, short enough to collide
    if (do_inserts) {
        std::cout << " Testing random Inserts..." << std::endl;
        for (size_t i = 0; i < NUM_INSERTS; ++i)
            CheckedInsert(gen_rand_string(gen, KEY_LEN));
        CheckedContent();
    }

    // inserting explicit duplicates of existing keys
    if (do_inserts) {
        std::cout << " Testing duplicate Inserts..." << std::endl;
        std::uniform_int_distribution<size_t> rand_idx(0, refvec.size() - 1);
        for (size_t i = 0; i < NUM_INSERTS / 3 + 1; ++i)
            CheckedInsert(refvec[rand_idx(gen)]);
        CheckedContent();
    }

    // searching keys that should be found
    if (do_inserts) {
        std::cout << " Testing found Searches..." << std::endl;
        std::uniform_int_distribution<size_t> rand_idx(0, refvec.size() - 1);
        for (size_t i = 0; i < NUM_FOUND_SEARCHES; ++i)
            CheckedSearch(refvec[rand_idx(gen)]);
    }

    // searching keys that should not be found
    std::cout << " Testing not-found Searches..." << std::endl;
    for (size_t i = 0; i < NUM_NOTFOUND_SEARCHES; ++i) {
        std::string key;
        do {
            key = gen_rand_string(gen, KEY_LEN + 1);
        } while (refset.contains(key));
        CheckedSearch(key);
    }

    // deleting keys that should not be found leaves the tree untouched
    std::cout << " Testing not-found Deletes..." << std::endl;
    unsigned height = lt->Height();
    for (size_t i = 0; i < NUM_NOTFOUND_DELETES; ++i) {
        std::string key;
        do {
            key = gen_rand_string(gen, KEY_LEN + 1);
        } while (refset.contains(key));
        CheckedDelete(key);
    }
    check(lt->Height() == height, "Height changed by not-found Deletes");
    CheckedContent();

    // deleting about half of the inserted keys, re-checking every key
    // after each delete so that remaining duplicates stay visible
    if (do_inserts) {
        std::cout << " Testing found Deletes..." << std::endl;
        std::shuffle(refvec.begin(), refvec.end(), gen);
        size_t ndeletes = refvec.size() / 2;
        for (size_t i = 0; i < ndeletes; ++i) {
            CheckedDelete(refvec[i]);
            CheckedSearch(refvec[i]);
        }
        for (auto&& key : refvec) CheckedSearch(key);
        check(lt->Height() == height, "Height changed by Deletes");
        CheckedContent();
    }

    // inserting again on top of the underflown leaves
    if (do_inserts) {
        std::cout << " Testing Inserts after Deletes..." << std::endl;
        for (size_t i = 0; i < NUM_INSERTS; ++i)
            CheckedInsert(gen_rand_string(gen, KEY_LEN));
        for (auto&& key : refvec) CheckedSearch(key);
        CheckedContent();
    }

    // deleting everything
    if (do_inserts) {
        std::cout << " Testing draining Deletes..." << std::endl;
        for (auto&& key : refvec) CheckedDelete(key);
        check(refset.empty(), "Reference set not drained");
        for (auto&& key : refvec) CheckedSearch(key);
        CheckedContent();
    }

    std::cout << " Single-thread BPTree tests passed!" << std::endl;
    delete lt;
}

int main(int argc, char* argv[]) {
    bool help;
    unsigned seed;

    cxxopts::Options cmd_args(argv[0]);
    cmd_args.add_options()("h,help", "print help message",
                           cxxopts::value<bool>(help)->default_value("false"))(
        "seed", "random seed, 0 for a random one",
        cxxopts::value<unsigned>(seed)->default_value("0"));
    auto result = cmd_args.parse(argc, argv);

    if (help) {
        printf("%s", cmd_args.help().c_str());
        return 0;
    }

    if (seed == 0) seed = std::random_device()();
    std::cout << "Seed " << seed << std::endl;
    std::mt19937 gen(seed);

    for (unsigned round = 0; round < NUM_ROUNDS; ++round) {
        std::cout << "Round " << round << " --" << std::endl;
        fuzzy_test_round(round != 0, gen);
    }

    return 0;
}
