#pragma once

#include <string>
#include <vector>

// Text heuristics for driving an interactive root shell. They only look at
// accumulated output, so they can be fed chunks of any size and replaced
// without touching the channel loops that use them.

// Scans the output of `su -` for the password prompt, the root prompt, or
// a failure message.
class ElevationScanner {
public:
    enum class Verdict {
        Continue,      // need more output
        SendPassword,  // prompt seen; write the password, then call password_sent()
        Elevated,      // root prompt after the password
        Failed,        // su reported an authentication failure
    };

    Verdict feed(const std::string& chunk);

    // Record that the password went out. Clears the buffer so the prompt
    // text is not matched again.
    void password_sent();

    bool has_sent_password() const { return password_sent_; }
    const std::string& buffer() const { return buffer_; }

private:
    std::string buffer_;
    bool password_sent_ = false;
};

// Collects elevated-shell output until the next root prompt.
class CommandCompletionScanner {
public:
    // Returns true once the buffer holds a prompt.
    bool feed(const std::string& chunk);

    const std::string& buffer() const { return buffer_; }

    // Output between the echoed command line and the trailing prompt.
    std::string output() const;

private:
    std::string buffer_;
};

// Split like a line reader: '\n' separated, trailing '\r' removed,
// no empty entry for a final newline.
std::vector<std::string> split_lines(const std::string& text);
