#include "include/shell.hpp"

#include <stdexcept>

#include "common.hpp"

namespace lexitree {

ShellCmd ParseShellCmd(const std::string& line) {
    std::string cmd = TrimSpace(line);
    return (cmd == "1" || cmd == "search")   ? CMD_SEARCH
           : (cmd == "2" || cmd == "insert") ? CMD_INSERT
           : (cmd == "3" || cmd == "delete") ? CMD_DELETE
           : (cmd == "4" || cmd == "stats")  ? CMD_STATS
           : (cmd == "5" || cmd == "exit")   ? CMD_EXIT
                                             : CMD_UNKNOWN;
}

Shell::Shell(Lexitree* index, std::istream& in, std::ostream& out)
    : index(index), in(in), out(out) {
    if (index == nullptr) throw LexitreeException("got nullptr as index");
}

void Shell::PrintMenu() {
    out << std::endl
        << "Lexitree Dictionary Menu" << std::endl
        << "1. Search word" << std::endl
        << "2. Insert word" << std::endl
        << "3. Delete word" << std::endl
        << "4. Show tree stats" << std::endl
        << "5. Exit" << std::endl;
}

bool Shell::ReadLine(const std::string& prompt, std::string& line) {
    out << prompt << std::flush;
    if (!std::getline(in, line)) return false;
    return true;
}

void Shell::DoSearch(const std::string& word) {
    if (index->Search(word))
        out << "Word \"" << word << "\" found." << std::endl;
    else
        out << "Sorry, \"" << word << "\" was not found." << std::endl;
}

void Shell::DoInsert(const std::string& word) {
    // the dictionary keeps one copy per word, though the index allows more
    if (index->Search(word)) {
        out << "Word \"" << word << "\" already exists." << std::endl;
        return;
    }
    index->Insert(word);
    out << "Inserted \"" << word << "\" into the tree." << std::endl;
}

void Shell::DoDelete(const std::string& word) {
    if (index->Delete(word))
        out << "Deleted \"" << word << "\" from the tree." << std::endl;
    else
        out << "Cannot delete \"" << word << "\": not found." << std::endl;
}

void Shell::DoStats() {
    BPTreeStats stats = index->GatherStats();
    out << stats << std::endl << "Words: " << index->Size() << std::endl;
}

size_t Shell::Run() {
    size_t ncmds = 0;
    std::string line, word;

    while (true) {
        PrintMenu();
        if (!ReadLine("Choose an option (1-5): ", line)) break;

        ShellCmd cmd = ParseShellCmd(line);
        if (cmd == CMD_EXIT) {
            out << "Exiting. Goodbye!" << std::endl;
            return ncmds;
        } else if (cmd == CMD_UNKNOWN) {
            out << "Invalid option \"" << TrimSpace(line) << "\", try again."
                << std::endl;
            continue;
        }

        // word-taking commands read one more line
        if (cmd != CMD_STATS) {
            std::string prompt =
                (cmd == CMD_SEARCH)   ? "Enter word to search: "
                : (cmd == CMD_INSERT) ? "Enter word to insert: "
                                      : "Enter word to delete: ";
            if (!ReadLine(prompt, word)) break;
            word = TrimSpace(word);
            if (word.empty()) {
                out << "Empty word, nothing to do." << std::endl;
                continue;
            }
        }

        try {
            switch (cmd) {
                case CMD_SEARCH:
                    DoSearch(word);
                    break;
                case CMD_INSERT:
                    DoInsert(word);
                    break;
                case CMD_DELETE:
                    DoDelete(word);
                    break;
                case CMD_STATS:
                    DoStats();
                    break;
                default:
                    throw LexitreeException("unrecognized shell command");
            }
        } catch (const std::exception& ex) {
            out << "Error: " << ex.what() << std::endl;
        }
        ncmds++;
    }

    out << std::endl << "End of input. Goodbye!" << std::endl;
    return ncmds;
}

}  // namespace lexitree
