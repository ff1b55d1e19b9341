// basic_usage.cpp
//
// Demonstrates a Printer standing in for plain console output: the same
// calls reach the terminal in color and a dated log file under logs/.
//
// Compile: g++ -std=c++11 -I include examples/basic_usage.cpp -o basic_usage -pthread

#include "print_log.hpp"
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

int main() {
    // --- Configuration ---
    printlog::ColorTable colors = printlog::ColorTable::defaults();
    colors.set("info", "\033[37m")          // white
          .set("error", "\033[91m")         // light red
          .set("success", "\033[92m")       // light green
          .set("warning", "\033[93m")       // light yellow
          .set("debug", "\033[90m")         // dark gray
          .set("critical", "\033[41m");     // red background

    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults()
        .logsDirectory("logs")
        .retentionDays(30)
        .timeZone(printlog::TimeZone::local())
        .useConsoleColors(printlog::PrintPolicy::detectColorSupport())
        .colors(colors);

    printlog::Printer print(policy);
    printlog::ErrorStreamCapture capture(print, std::cerr);
    capture.install();

    // --- Default level ---
    print("System initializing...");
    print(printlog::PrintOptions().end("..."), "Loading modules");
    print("Done!");  // continues the same line on screen and in the file

    // --- Severity levels ---
    print.success("Database connected successfully.");
    print.warning("High latency detected:", "450ms");
    print.error("Connection dropped.");
    print.critical("System Failure! Shutting down.");

    std::map<std::string, int> state;
    state["x"] = 10;
    state["y"] = 20;
    print.debug("Variable state: x =", state["x"], "y =", state["y"]);

    // --- Error stream capture ---
    try {
        throw std::runtime_error("division by zero");
    } catch (const std::exception& ex) {
        std::cerr << "Unhandled error: " << ex.what() << "\n";
    }

    capture.restore();
    std::cout << "Log written to " << print.currentLogPath() << std::endl;
    return 0;
}
