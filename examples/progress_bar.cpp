// progress_bar.cpp
//
// Demonstrates in-place progress output. On the terminal each '\r' returns
// the cursor; in the log file the same '\r' replaces the previous entry, so
// only the final state of the bar is kept.
//
// Compile: g++ -std=c++11 -I include examples/progress_bar.cpp -o progress_bar -pthread

#include "print_log.hpp"
#include <chrono>
#include <string>
#include <thread>

static std::string bar(int percent) {
    static const int kWidth = 20;
    int filled = percent * kWidth / 100;
    return "[" + std::string(filled, '#') + std::string(kWidth - filled, '.') + "] " +
           std::to_string(percent) + "%";
}

int main() {
    printlog::Printer print(printlog::PrintPolicy::defaults()
        .logsDirectory("logs")
        .useConsoleColors(printlog::PrintPolicy::detectColorSupport()));

    print.info("Downloading dataset");

    printlog::PrintOptions inPlace = printlog::PrintOptions().end("").flush();
    print.info(inPlace, bar(0));
    for (int percent = 10; percent <= 100; percent += 10) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        print.info(inPlace, "\r" + bar(percent));
    }
    print("");  // terminate the line; the file keeps "[####...] 100%"

    // Unterminated text followed by a continuation shares one file line.
    print(printlog::PrintOptions().end(" "), "Verifying checksum...");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    print.success("ok");

    return 0;
}
