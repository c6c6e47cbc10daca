#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

// ================= SCAN EVENT TYPES =================

enum class ScanEvent : uint8_t {
    NONE,        // nothing complete yet
    LINE,        // a UID is ready in line()
    INTERRUPT    // Ctrl+C from the console
};

// ================= SCAN READER =================
// Builds UIDs from console bytes, one per line. The reader/keyboard
// wedge terminates each card with CR, LF or both.

class ScanReader {
public:
    static const char INTERRUPT_CHAR = 0x03;

    explicit ScanReader(size_t maxLength);

    ScanEvent feed(char c);
    const std::string& line() const { return current; }

private:
    ScanEvent finishLine();

    size_t maxLength;
    std::string pending;
    std::string current;
    bool overflowed;
};
