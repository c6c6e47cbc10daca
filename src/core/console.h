#pragma once

// ================= DIAGNOSTIC CONSOLE =================
// Every module prints "[TAG] message" lines through here. The sink is
// the serial port on the device and stdout on the host.

class Console {
public:
    typedef void (*Sink)(const char* text);

    static void init(Sink sink);
    static void printf(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
    static void println(const char* line);

private:
    static Sink sink;
};
