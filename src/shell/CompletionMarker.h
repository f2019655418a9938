#pragma once
#include <string>

/**
 * @brief Sentinel that frames one command's output on the shell's stdout.
 *
 * The command is followed by `echo '<token>'$?`, so the shell prints
 * `<token><exit code>` once the command finished. Output that happens to
 * contain the token would end the frame early; the token is unique per call.
 */
class CompletionMarker {
public:
    explicit CompletionMarker(std::string token);

    // __BASH_CMD_DONE_<ns timestamp>_<sequence>__
    static CompletionMarker generate();

    const std::string& token() const { return markerToken; }

    // Text written to the shell's stdin for one command.
    std::string frame(const std::string& command) const;

    /**
     * @brief Checks whether a stdout line closes the frame.
     * @param line line read from stdout, without its newline
     * @param leading receives output printed before the marker on the same line
     *        (a command whose output lacks a trailing newline)
     * @param exitCode receives the exit code digits
     */
    bool match(const std::string& line, std::string& leading, std::string& exitCode) const;

private:
    std::string markerToken;
};
