/*
 * Command prompt - AI-Ghostline
 * Raw-mode prompt for the interactive CLI: insertion, Backspace, Enter,
 * Up/Down history and Tab completion of the command word.
 */
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace ghostline {

class CommandPrompt {
public:
    explicit CommandPrompt(std::vector<std::string> commands) : m_commands(std::move(commands)) {}

    // eof is set on Ctrl-D at an empty prompt or when stdin is exhausted.
    // Non-empty lines are added to the history.
    std::string read_line(const std::string& prompt, bool& eof);

    // Commands starting with `word`.
    std::vector<std::string> matches(const std::string& word) const;

private:
    std::vector<std::string> m_commands;
    std::vector<std::string> m_history;
};

} // namespace ghostline
