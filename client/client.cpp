#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

#include "cxxopts.hpp"
#include "lexitree.hpp"
#include "loader.hpp"
#include "shell.hpp"

int main(int argc, char* argv[]) {
    bool help, discard_split, stats;
    std::string file;
    size_t max_keys;

    cxxopts::Options cmd_args(argv[0]);
    cmd_args.add_options()("h,help", "print help message",
                           cxxopts::value<bool>(help)->default_value("false"))(
        "f,file", "word list to load at startup",
        cxxopts::value<std::string>(file)->default_value("words.txt"))(
        "k,max_keys", "max number of keys per node",
        cxxopts::value<size_t>(max_keys)->default_value("4"))(
        "discard_split", "drop the promoted key from leaves on split",
        cxxopts::value<bool>(discard_split)->default_value("false"))(
        "s,stats", "print tree stats after loading",
        cxxopts::value<bool>(stats)->default_value("false"));
    auto result = cmd_args.parse(argc, argv);

    if (help) {
        printf("%s", cmd_args.help().c_str());
        return 0;
    }

    lexitree::Lexitree* lt = nullptr;
    try {
        lt = lexitree::Lexitree::Open(max_keys, discard_split
                                                    ? lexitree::SPLIT_DISCARD
                                                    : lexitree::SPLIT_COPY_UP);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        printf("%s", cmd_args.help().c_str());
        return 1;
    }

    // a missing word list is not fatal, the shell starts with what loaded
    try {
        size_t nloaded = lexitree::LoadKeys(file, lt);
        std::cout << "Loaded " << nloaded << " words into the B+ tree."
                  << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
    }

    if (stats) {
        try {
            std::cout << lt->GatherStats() << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "Error: " << ex.what() << std::endl;
            delete lt;
            return 1;
        }
    }

    lexitree::Shell shell(lt, std::cin, std::cout);
    shell.Run();

    delete lt;
    return 0;
}
