#include "resource_guard.hpp"
#include "../logger/Mylogger.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <malloc.h>

namespace resource_guard
{
    ResourceGuard::ResourceGuard(bool enabled, double limitMB) : enabled_(enabled), limitMB_(limitMB) {}

    double ResourceGuard::currentUsageMB() const
    {
        std::ifstream status("/proc/self/status");
        if (!status.is_open())
            return 0.0;

        std::string line;
        while (std::getline(status, line))
        {
            // "VmRSS:     123456 kB"
            if (line.compare(0, 6, "VmRSS:") == 0)
            {
                std::istringstream iss(line.substr(6));
                double kb = 0.0;
                iss >> kb;
                return kb / 1024.0;
            }
        }
        return 0.0;
    }

    bool ResourceGuard::overLimit() const
    {
        if (!enabled_)
            return false;

        double usage = currentUsageMB();
        if (usage > limitMB_)
        {
            MyLogger::warning("Memory usage " + std::to_string(static_cast<long>(usage)) + " MB exceeds limit " +
                              std::to_string(static_cast<long>(limitMB_)) + " MB");
            return true;
        }
        return false;
    }

    void ResourceGuard::releaseMemory() const
    {
        double before = currentUsageMB();
        malloc_trim(0);
        MyLogger::debug("Released memory: " + std::to_string(static_cast<long>(before)) + " MB -> " +
                        std::to_string(static_cast<long>(currentUsageMB())) + " MB");
    }
} // namespace resource_guard
