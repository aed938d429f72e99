#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "clock.hpp"

namespace mailfwd::delivery {

struct MxRecord {
    std::string hostname;
    int priority;

    bool operator<(const MxRecord& other) const {
        return priority < other.priority;
    }
};

// Raw DNS MX query. Returns an empty list when the domain exists but has no
// MX records; throws DnsResolutionError otherwise.
class MxLookup {
public:
    virtual ~MxLookup() = default;
    virtual std::vector<MxRecord> lookup(const std::string& domain) = 0;
};

class ResolvMxLookup : public MxLookup {
public:
    std::vector<MxRecord> lookup(const std::string& domain) override;
};

class MxResolver {
public:
    struct Stats {
        uint64_t lookups = 0;
        uint64_t cache_hits = 0;
    };

    explicit MxResolver(std::shared_ptr<MxLookup> lookup,
                        std::chrono::seconds ttl = std::chrono::hours(1),
                        std::shared_ptr<Clock> clock = Clock::system());

    // Exchangers in ascending preference order, or the domain itself when it
    // publishes no MX. NXDOMAIN and other DNS failures propagate.
    std::vector<std::string> resolve(const std::string& domain);

    void clear_cache();
    size_t cache_size() const;
    Stats stats() const;

private:
    struct Entry {
        std::vector<std::string> hosts;
        Clock::time_point expires_at;
    };

    std::shared_ptr<MxLookup> lookup_;
    std::chrono::seconds ttl_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> cache_;
    Stats stats_;
};

}  // namespace mailfwd::delivery
