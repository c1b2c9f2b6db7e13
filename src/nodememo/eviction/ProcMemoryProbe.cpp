#include <nodememo/eviction/ProcMemoryProbe.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <sys/resource.h>
#include <unistd.h>

namespace NM {

namespace {

auto read_resident_pages(std::filesystem::path const& path) -> std::optional<std::uint64_t> {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::uint64_t size     = 0;
    std::uint64_t resident = 0;
    if (!(in >> size >> resident)) {
        return std::nullopt;
    }
    return resident;
}

auto read_mem_total(std::filesystem::path const& path) -> std::optional<std::uint64_t> {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.starts_with("MemTotal:")) {
            continue;
        }
        std::istringstream fields(line.substr(9));
        std::uint64_t      kilobytes = 0;
        if (!(fields >> kilobytes) || kilobytes == 0) {
            return std::nullopt;
        }
        return kilobytes * 1024;
    }
    return std::nullopt;
}

auto address_space_limit() -> std::optional<std::uint64_t> {
    rlimit limit{};
    if (::getrlimit(RLIMIT_AS, &limit) != 0 || limit.rlim_cur == RLIM_INFINITY) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(limit.rlim_cur);
}

} // namespace

ProcMemoryProbe::ProcMemoryProbe(std::filesystem::path statmPath, std::filesystem::path meminfoPath)
    : statmPath_(std::move(statmPath)), meminfoPath_(std::move(meminfoPath)) {}

auto ProcMemoryProbe::sample() -> std::optional<MemoryUsage> {
    auto const pages = read_resident_pages(statmPath_);
    if (!pages) {
        return std::nullopt;
    }
    auto const pageSize = ::sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return std::nullopt;
    }

    auto limit = read_mem_total(meminfoPath_);
    if (auto const rlimit = address_space_limit()) {
        limit = limit ? std::min(*limit, *rlimit) : *rlimit;
    }
    if (!limit) {
        return std::nullopt;
    }
    return MemoryUsage{*pages * static_cast<std::uint64_t>(pageSize), *limit};
}

} // namespace NM
