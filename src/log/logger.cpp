#include "logger.hpp"
#include <fstream>
#include <iostream>
#include <ctime>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdarg>   // va_list
#include <cstdio>    // vsnprintf
#include <cstring>
#include <errno.h>
#include <mutex>

namespace {
std::mutex g_logMutex;
std::string g_logDir = LOG_DIR;
}

void Logger::setDirectory(const std::string& dir)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logDir = dir;
}

std::string Logger::directory()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_logDir;
}

void Logger::write(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    const std::string& dir = g_logDir;
    const std::string filePath = dir + "/" + LOG_FILE_NAME;

    if (access(dir.c_str(), F_OK) == -1) {
        if (mkdir(dir.c_str(), 0755) == -1) {
            std::cerr << "[Logger] cannot create " << dir << ": " << strerror(errno) << std::endl;
            return;
        }
    }

    time_t now = time(nullptr);
    tm ltm{};
    localtime_r(&now, &ltm);

    char timeStr[32];
    strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &ltm);

    std::ofstream logFile(filePath, std::ios::app);
    if (logFile.is_open()) {
        logFile << "[" << timeStr << "] " << message << std::endl;
    } else {
        std::cerr << "[Logger] cannot open " << filePath << std::endl;
    }
}

void Logger::writef(const char* format, ...)
{
		char buffer[1024];

		va_list args;
		va_start(args, format);
		vsnprintf(buffer, sizeof(buffer), format, args);
		va_end(args);

		write(std::string(buffer));
}
