#ifndef PRINT_LOG_LOG_DIRECTORY_HPP
#define PRINT_LOG_LOG_DIRECTORY_HPP

#include "log_common.hpp"
#include "print_policy.hpp"
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

#include <sys/stat.h>
#ifdef _MSC_VER
#include <direct.h>
#include <io.h>
#else
#include <unistd.h>
#include <dirent.h>
#endif

namespace printlog {

    /// Startup housekeeping for the logs directory: create it and delete
    /// files that fell out of the retention window.
    class LogDirectory {
    public:
        /// Create the logs directory and remove expired files.
        /// Does nothing when file logging is disabled. On failure prints a
        /// warning to stderr and returns false; logging continues and the
        /// file channel degrades on its own.
        static bool prepare(const PrintPolicy& policy) {
            if (!policy.logToFile()) return true;
            if (!mkdirRecursive(policy.logsDirectory())) {
                std::fprintf(stderr, "Warning: Could not create logs directory '%s'.\n",
                             policy.logsDirectory().c_str());
                return false;
            }
            cleanupExpired(policy, policy.now());
            return true;
        }

        /// Delete every regular file in the logs directory whose modification
        /// date, in the policy's zone, is before `today - retentionDays`.
        /// Returns the number of files removed.
        static std::size_t cleanupExpired(const PrintPolicy& policy,
                                          std::chrono::system_clock::time_point now) {
            const std::string& dir = policy.logsDirectory();
            if (!isDirectory(dir)) return 0;

            const TimeZone& zone = policy.timeZone();
            CivilDate cutoff = zone.dateOf(now).addDays(-policy.retentionDays());

            std::size_t removed = 0;
            std::vector<std::string> entries = listDirectory(dir);
            for (size_t i = 0; i < entries.size(); ++i) {
                std::string path = detail::joinPath(dir, entries[i]);
                std::time_t mtime = 0;
                if (!regularFileMTime(path, mtime)) continue;

                CivilDate fileDate = zone.dateOf(std::chrono::system_clock::from_time_t(mtime));
                if (fileDate < cutoff && std::remove(path.c_str()) == 0) {
                    ++removed;
                }
            }
            return removed;
        }

        static bool mkdirRecursive(const std::string& path) {
            if (path.empty()) return true;
            struct stat st;
            if (stat(path.c_str(), &st) == 0) return (st.st_mode & S_IFMT) == S_IFDIR;

            size_t slashPos = path.find_last_of("/\\");
            if (slashPos != std::string::npos && slashPos > 0) {
                if (!mkdirRecursive(path.substr(0, slashPos))) return false;
            }
#ifdef _MSC_VER
            return _mkdir(path.c_str()) == 0 || errno == EEXIST;
#else
            return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
#endif
        }

    private:
        static bool isDirectory(const std::string& path) {
            struct stat st;
            if (stat(path.c_str(), &st) != 0) return false;
            return (st.st_mode & S_IFMT) == S_IFDIR;
        }

        static bool regularFileMTime(const std::string& path, std::time_t& mtime) {
            struct stat st;
            if (stat(path.c_str(), &st) != 0) return false;
            if ((st.st_mode & S_IFMT) != S_IFREG) return false;
            mtime = st.st_mtime;
            return true;
        }

        static std::vector<std::string> listDirectory(const std::string& dirPath) {
            std::vector<std::string> entries;
#ifdef _MSC_VER
            struct _finddata_t fileinfo;
            std::string pattern = dirPath + "/*";
            intptr_t handle = _findfirst(pattern.c_str(), &fileinfo);
            if (handle == -1) return entries;
            do {
                std::string name = fileinfo.name;
                if (name != "." && name != "..") {
                    entries.push_back(name);
                }
            } while (_findnext(handle, &fileinfo) == 0);
            _findclose(handle);
#else
            DIR* dir = opendir(dirPath.c_str());
            if (!dir) return entries;
            struct dirent* ent;
            while ((ent = readdir(dir)) != nullptr) {
                std::string name = ent->d_name;
                if (name != "." && name != "..") {
                    entries.push_back(name);
                }
            }
            closedir(dir);
#endif
            return entries;
        }
    };

} // namespace printlog

#endif // PRINT_LOG_LOG_DIRECTORY_HPP
