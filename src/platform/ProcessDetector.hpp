#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Scans the process table for running copies of an executable
class ProcessDetector
{
public:
    struct ProcessEntry
    {
        std::uint32_t pid;
        std::string name;
    };

    // Processes other than the caller whose image name matches executableName.
    // Windows compares the image name case-insensitively. Elsewhere /proc/<pid>/comm
    // is compared with the name and with its stem, both cut to the kernel's 15 characters.
    static std::vector<ProcessEntry> findInstances(const std::string& executableName);
};
