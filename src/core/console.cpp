#include "console.h"

#include <stdarg.h>
#include <stdio.h>

static const size_t CONSOLE_LINE_MAX = 512;

static void stdoutSink(const char* text) {
    fputs(text, stdout);
    fflush(stdout);
}

Console::Sink Console::sink = stdoutSink;

void Console::init(Sink s) {
    sink = s ? s : stdoutSink;
}

void Console::printf(const char* fmt, ...) {
    char buf[CONSOLE_LINE_MAX];

    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    if (n < 0) return;

    // Keep the line terminated even when the message was cut short
    if (static_cast<size_t>(n) >= sizeof(buf)) {
        buf[sizeof(buf) - 2] = '\n';
    }

    sink(buf);
}

void Console::println(const char* line) {
    printf("%s\n", line);
}
