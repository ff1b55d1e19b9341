// error_capture.cpp
//
// Demonstrates routing std::cerr through the log file. Output still reaches
// the terminal unchanged; each complete line is also recorded with the
// error tag. The capture is scoped, so std::cerr is restored on exit.
//
// Compile: g++ -std=c++11 -I include examples/error_capture.cpp -o error_capture -pthread

#include "print_log.hpp"
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static void worker(printlog::Printer& print, int id) {
    try {
        if (id % 2 == 1) {
            throw std::runtime_error("worker " + std::to_string(id) + " failed");
        }
        print.success("worker", id, "finished");
    } catch (const std::exception& ex) {
        // One insertion per report keeps concurrent reports apart.
        std::cerr << ("Traceback (worker " + std::to_string(id) + "):\n  " + ex.what() + "\n");
    }
}

int main() {
    printlog::Printer print(printlog::PrintPolicy::defaults()
        .logsDirectory("logs")
        .tag(printlog::Severity::Error, "[STDERR]"));

    {
        printlog::ErrorStreamCapture capture(print, std::cerr);
        if (!capture.install()) {
            print.warning("error capture disabled by configuration");
        }

        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back(worker, std::ref(print), i);
        }
        for (auto& t : threads) {
            t.join();
        }

        // A partial line is held until restore() pushes it to the file.
        std::cerr << "shutting down";
    }

    print("Captured lines are in", print.currentLogPath());
    return 0;
}
