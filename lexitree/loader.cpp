#include "include/loader.hpp"

#include <filesystem>
#include <fstream>

#include "common.hpp"

namespace lexitree {

size_t LoadKeys(const std::string& path, Lexitree* index) {
    if (index == nullptr) throw LexitreeException("got nullptr as index");

    if (!std::filesystem::exists(path))
        throw LexitreeException("file not found: " + path);
    if (std::filesystem::is_directory(path))
        throw LexitreeException("not a regular file: " + path);

    std::ifstream input(path);
    if (!input.is_open())
        throw LexitreeException("failed to open file: " + path);

    size_t nloaded = 0;
    std::string line;
    while (std::getline(input, line)) {
        std::string key = TrimSpace(line);
        if (key.empty()) continue;

        index->Insert(std::move(key));
        nloaded++;
    }

    // getline sets failbit at end of file; badbit means a real read error
    if (input.bad()) {
        throw LexitreeException("read error in " + path + " after " +
                                std::to_string(nloaded) + " keys");
    }

    DEBUG("loaded %zu keys from %s", nloaded, path.c_str());
    return nloaded;
}

}  // namespace lexitree
