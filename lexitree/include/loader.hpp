// Loader -- bulk-load a newline-delimited word list into an index.

#include <string>

#include "lexitree.hpp"

#pragma once

namespace lexitree {

/**
 * Read the file at path line by line, strip surrounding whitespace, skip
 * blank lines, and insert every remaining line as one key in source order.
 * Returns the number of keys inserted.
 *
 * Throws if the file is missing or cannot be opened, before the index is
 * touched. If reading fails midway, keys inserted so far stay in the index
 * and an exception is thrown.
 */
size_t LoadKeys(const std::string& path, Lexitree* index);

}  // namespace lexitree
