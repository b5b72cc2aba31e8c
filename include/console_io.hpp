#pragma once
#include <string>
#include <iostream>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <termios.h>
  #include <unistd.h>
#endif

// Turns terminal echo off for its lifetime and restores the previous mode on
// every exit, including exceptions thrown out of std::getline.
class EchoOffGuard {
public:
    EchoOffGuard() {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        m_active = GetConsoleMode(m_handle, &m_oldMode) != 0;
        if (m_active) SetConsoleMode(m_handle, m_oldMode & ~ENABLE_ECHO_INPUT);
#else
        m_active = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &m_old) == 0;
        if (m_active) {
            termios noEcho = m_old;
            noEcho.c_lflag &= ~ECHO;
            tcsetattr(STDIN_FILENO, TCSANOW, &noEcho);
        }
#endif
    }

    ~EchoOffGuard() {
        if (!m_active) return;
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_oldMode);
#else
        tcsetattr(STDIN_FILENO, TCSANOW, &m_old);
#endif
    }

    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;

private:
    bool m_active = false;
#if defined(_WIN32)
    HANDLE m_handle = nullptr;
    DWORD  m_oldMode = 0;
#else
    termios m_old{};
#endif
};

// Read one line without echo. Piped stdin (no tty) is read as-is.
// Caller owns the result and should secureWipe() it when done.
inline std::string prompt_hidden(const std::string& message) {
    std::cerr << message << std::flush;
    std::string out;
    {
        EchoOffGuard guard;
        std::getline(std::cin, out);
    }
    if (!out.empty() && out.back() == '\r') out.pop_back();
    std::cerr << "\n";
    return out;
}
