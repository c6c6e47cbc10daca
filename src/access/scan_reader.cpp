#include "scan_reader.h"
#include "core/console.h"

#include <ctype.h>

static std::string trimmed(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();

    while (begin < end && isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && isspace(static_cast<unsigned char>(s[end - 1]))) end--;

    return s.substr(begin, end - begin);
}

ScanReader::ScanReader(size_t maxLength)
    : maxLength(maxLength), overflowed(false) {
    pending.reserve(maxLength);
}

ScanEvent ScanReader::feed(char c) {
    if (c == INTERRUPT_CHAR) {
        pending.clear();
        overflowed = false;
        return ScanEvent::INTERRUPT;
    }

    if (c == '\n' || c == '\r') {
        return finishLine();
    }

    if (overflowed) return ScanEvent::NONE;

    if (pending.size() >= maxLength) {
        Console::printf("[SCAN] Input longer than %u chars, discarding line\n",
                        static_cast<unsigned>(maxLength));
        pending.clear();
        overflowed = true;
        return ScanEvent::NONE;
    }

    pending += c;
    return ScanEvent::NONE;
}

ScanEvent ScanReader::finishLine() {
    if (overflowed) {
        overflowed = false;
        return ScanEvent::NONE;
    }

    std::string uid = trimmed(pending);
    pending.clear();

    // CRLF and blank lines produce nothing
    if (uid.empty()) return ScanEvent::NONE;

    current = uid;
    Console::printf("[SCAN] RFID Scanned: %s\n", current.c_str());
    return ScanEvent::LINE;
}
