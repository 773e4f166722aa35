// Shell -- line-oriented interactive menu over an index.

#include <iostream>
#include <string>

#include "lexitree.hpp"

#pragma once

namespace lexitree {

/**
 * Menu commands enum.
 */
typedef enum ShellCmd {
    CMD_SEARCH,
    CMD_INSERT,
    CMD_DELETE,
    CMD_STATS,
    CMD_EXIT,
    CMD_UNKNOWN
} ShellCmd;

/**
 * Parse one menu choice line. Accepts the menu number or the command name,
 * case-sensitive, surrounding whitespace ignored.
 */
ShellCmd ParseShellCmd(const std::string& line);

/**
 * Request/response loop: prints the menu, reads one command at a time from
 * the input stream, dispatches it to the index and prints the outcome.
 * Terminates on the exit command or end of input. Nothing is saved.
 */
class Shell {
   private:
    Lexitree* index;
    std::istream& in;
    std::ostream& out;

    void PrintMenu();

    /**
     * Print prompt and read one line. Returns false on end of input.
     */
    bool ReadLine(const std::string& prompt, std::string& line);

    void DoSearch(const std::string& word);
    void DoInsert(const std::string& word);
    void DoDelete(const std::string& word);
    void DoStats();

   public:
    Shell(Lexitree* index, std::istream& in, std::ostream& out);

    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    ~Shell() = default;

    /**
     * Run the loop until exit. Returns the number of index commands
     * executed, not counting exit, invalid choices or empty words.
     */
    size_t Run();
};

}  // namespace lexitree
