#include <benchmark/benchmark.h>
#include <cstdio>
#include <string>
#include "print_log.hpp"
#include "null_stream.hpp"

#ifdef _WIN32
#include <direct.h>
#include <process.h>
#include <windows.h>
#define BENCH_GETPID() _getpid()
#define BENCH_RMDIR(p) _rmdir(p)
static std::string tempDir() {
    char buf[MAX_PATH];
    GetTempPathA(MAX_PATH, buf);
    return std::string(buf);
}
#else
#include <unistd.h>
#define BENCH_GETPID() getpid()
#define BENCH_RMDIR(p) rmdir(p)
static std::string tempDir() { return "/tmp/"; }
#endif

static std::string benchDir(const std::string& suffix) {
    return tempDir() + "print_log_bench_" + std::to_string(BENCH_GETPID()) + "_" + suffix;
}

// Removes the single daily file the Printer created, then its directory.
static void removeBenchDir(const std::string& dir, const std::string& logPath) {
    if (!logPath.empty()) std::remove(logPath.c_str());
    BENCH_RMDIR(dir.c_str());
}

static printlog::PrintPolicy benchPolicy(const std::string& dir) {
    return printlog::PrintPolicy::defaults()
        .logsDirectory(dir)
        .useConsoleColors(false)
        .captureStderr(false);
}

// ---------------------------------------------------------------------------
// BM_Console_Only
// Console path alone; the terminal is a discarding stream.
// ---------------------------------------------------------------------------
static void BM_Console_Only(benchmark::State& state) {
    printlog::NullStream console;
    printlog::Printer print(benchPolicy(benchDir("console")).logToFile(false), console);

    for (auto _ : state) {
        print("Console line", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Console_Only);

// ---------------------------------------------------------------------------
// BM_Console_Colored
// Console path with escape sequences wrapped around each message.
// ---------------------------------------------------------------------------
static void BM_Console_Colored(benchmark::State& state) {
    printlog::NullStream console;
    printlog::Printer print(benchPolicy(benchDir("colored")).logToFile(false).useConsoleColors(true),
                            console);

    for (auto _ : state) {
        print.warning("Colored line", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Console_Colored);

// ---------------------------------------------------------------------------
// BM_File_Line
// One terminated line per call: timestamp, preamble, write and flush.
// ---------------------------------------------------------------------------
static void BM_File_Line(benchmark::State& state) {
    std::string dir = benchDir("line");
    std::string logPath;
    {
        printlog::NullStream console;
        printlog::Printer print(benchPolicy(dir).logToConsole(false), console);
        logPath = print.currentLogPath();

        for (auto _ : state) {
            print.info("File line", 42);
            benchmark::ClobberMemory();
        }
        state.SetItemsProcessed(state.iterations());
    }
    removeBenchDir(dir, logPath);
}
BENCHMARK(BM_File_Line);

// ---------------------------------------------------------------------------
// BM_File_MultiLine
// Four-line message; every line gets its own preamble.
// ---------------------------------------------------------------------------
static void BM_File_MultiLine(benchmark::State& state) {
    std::string dir = benchDir("multiline");
    std::string logPath;
    {
        printlog::NullStream console;
        printlog::Printer print(benchPolicy(dir).logToConsole(false), console);
        logPath = print.currentLogPath();

        for (auto _ : state) {
            print.error("Traceback:\n  frame one\n  frame two\nRuntimeError: boom");
            benchmark::ClobberMemory();
        }
        state.SetItemsProcessed(state.iterations());
    }
    removeBenchDir(dir, logPath);
}
BENCHMARK(BM_File_MultiLine);

// ---------------------------------------------------------------------------
// BM_File_Overwrite
// Progress updates: each '\r' call truncates the previous entry.
// ---------------------------------------------------------------------------
static void BM_File_Overwrite(benchmark::State& state) {
    std::string dir = benchDir("overwrite");
    std::string logPath;
    {
        printlog::NullStream console;
        printlog::Printer print(benchPolicy(dir).logToConsole(false), console);
        logPath = print.currentLogPath();
        printlog::PrintOptions inPlace = printlog::PrintOptions().end("");
        print.info(inPlace, "Progress 0%");

        int percent = 0;
        for (auto _ : state) {
            percent = (percent + 1) % 100;
            print.info(inPlace, "\rProgress " + std::to_string(percent) + "%");
            benchmark::ClobberMemory();
        }
        state.SetItemsProcessed(state.iterations());
    }
    removeBenchDir(dir, logPath);
}
BENCHMARK(BM_File_Overwrite);

// ---------------------------------------------------------------------------
// BM_Capture_Write
// Error stream capture: forward to the original buffer and log the line.
// ---------------------------------------------------------------------------
static void BM_Capture_Write(benchmark::State& state) {
    std::string dir = benchDir("capture");
    std::string logPath;
    {
        printlog::NullStream errors;
        printlog::Printer print(benchPolicy(dir).logToConsole(false).captureStderr(true), errors);
        logPath = print.currentLogPath();
        printlog::ErrorStreamCapture capture(print, errors);
        capture.install();

        for (auto _ : state) {
            errors << "warning: deprecated call\n";
            benchmark::ClobberMemory();
        }
        state.SetItemsProcessed(state.iterations());
    }
    removeBenchDir(dir, logPath);
}
BENCHMARK(BM_Capture_Write);
