#ifndef PAGESMITH_COLOR_HPP
#define PAGESMITH_COLOR_HPP

#include <sys/ioctl.h>
#include <unistd.h>

// ANSI colour codes for terminal output
#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define CYAN    "\033[36m"

/// @return Columns of the terminal on stderr, 80 when it is not a terminal.
inline unsigned get_terminal_width() {
    winsize ws{};
    if (isatty(STDERR_FILENO) && ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return 80;
}

#endif // PAGESMITH_COLOR_HPP
