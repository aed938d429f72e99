#include "mx_resolver.hpp"
#include "delivery_errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>

#include <netdb.h>
#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <resolv.h>

namespace mailfwd::delivery {

std::vector<MxRecord> ResolvMxLookup::lookup(const std::string& domain) {
    std::vector<MxRecord> records;

    unsigned char answer[NS_MAXMSG];
    int len = res_query(domain.c_str(), ns_c_in, ns_t_mx, answer, sizeof(answer));

    if (len < 0) {
        switch (h_errno) {
            case HOST_NOT_FOUND:
                throw DnsResolutionError(domain, "NXDOMAIN for " + domain, true);
            case NO_DATA:
                return records;
            case TRY_AGAIN:
                throw DnsResolutionError(domain, "Temporary DNS failure for " + domain, false);
            default:
                throw DnsResolutionError(domain, "DNS lookup failed for " + domain + ": " +
                                         hstrerror(h_errno), false);
        }
    }

    ns_msg msg;
    if (ns_initparse(answer, len, &msg) < 0) {
        throw DnsResolutionError(domain, "Malformed DNS response for " + domain, false);
    }

    int count = ns_msg_count(msg, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&msg, ns_s_an, i, &rr) < 0) {
            continue;
        }

        if (ns_rr_type(rr) != ns_t_mx) {
            continue;
        }

        const unsigned char* rdata = ns_rr_rdata(rr);
        int priority = ns_get16(rdata);

        char exchange[NS_MAXDNAME];
        if (dn_expand(answer, answer + len, rdata + 2, exchange, sizeof(exchange)) < 0) {
            continue;
        }

        records.push_back({exchange, priority});
    }

    return records;
}

MxResolver::MxResolver(std::shared_ptr<MxLookup> lookup,
                       std::chrono::seconds ttl,
                       std::shared_ptr<Clock> clock)
    : lookup_(std::move(lookup))
    , ttl_(ttl)
    , clock_(std::move(clock)) {
}

std::vector<std::string> MxResolver::resolve(const std::string& domain) {
    std::string key = domain;
    std::transform(key.begin(), key.end(), key.begin(), ::tolower);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            if (clock_->now() < it->second.expires_at) {
                ++stats_.cache_hits;
                LOG_DEBUG_FMT("MX cache hit for {}", key);
                return it->second.hosts;
            }
            cache_.erase(it);
        }
        ++stats_.lookups;
    }

    auto records = lookup_->lookup(key);

    std::vector<std::string> hosts;
    if (records.empty()) {
        LOG_DEBUG_FMT("No MX records for {}, using the domain itself", key);
        hosts.push_back(key);
    } else {
        std::stable_sort(records.begin(), records.end());
        for (const auto& record : records) {
            hosts.push_back(record.hostname);
        }
        LOG_DEBUG_FMT("MX for {}: {} host(s), preferred {}", key, hosts.size(), hosts.front());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = Entry{hosts, clock_->now() + ttl_};
    return hosts;
}

void MxResolver::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t MxResolver::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

MxResolver::Stats MxResolver::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace mailfwd::delivery
