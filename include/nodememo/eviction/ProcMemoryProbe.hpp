#pragma once

#include <nodememo/eviction/EnvironmentSignals.hpp>

#include <filesystem>
#include <optional>

namespace NM {

/**
 * ProcMemoryProbe: process memory usage from procfs.
 *
 * used  = resident pages from `statm` times the page size.
 * limit = the address-space rlimit when one is set, otherwise (or when it is
 *         larger) MemTotal from `meminfo`.
 * Missing or unreadable files yield std::nullopt.
 */
class ProcMemoryProbe final : public MemoryProbe {
public:
    explicit ProcMemoryProbe(std::filesystem::path statmPath   = "/proc/self/statm",
                             std::filesystem::path meminfoPath = "/proc/meminfo");

    auto sample() -> std::optional<MemoryUsage> override;

private:
    std::filesystem::path statmPath_;
    std::filesystem::path meminfoPath_;
};

} // namespace NM
