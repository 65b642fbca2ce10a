#pragma once
#include <atomic>
#include <nlohmann/json.hpp>

class Metrics {
public:
    // HTTP
    void incHttpTotal() { http_requests_total_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteHealth() { http_requests_health_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteMetrics() { http_requests_metrics_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteKeyGet() { http_requests_key_get_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteKeySet() { http_requests_key_set_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteKeyDelete() { http_requests_key_delete_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteKeyList() { http_requests_key_list_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteOther() { http_requests_other_.fetch_add(1, std::memory_order_relaxed); }

    // Authorization gate
    void incAuthMissing() { auth_missing_.fetch_add(1, std::memory_order_relaxed); }
    void incAuthInvalid() { auth_invalid_.fetch_add(1, std::memory_order_relaxed); }

    // KV outcomes
    void incKvGetHits() { kv_get_hits_.fetch_add(1, std::memory_order_relaxed); }
    void incKvGetMisses() { kv_get_misses_.fetch_add(1, std::memory_order_relaxed); }
    void incKvSets() { kv_sets_.fetch_add(1, std::memory_order_relaxed); }
    void incKvDeleteHits() { kv_delete_hits_.fetch_add(1, std::memory_order_relaxed); }
    void incKvDeleteMisses() { kv_delete_misses_.fetch_add(1, std::memory_order_relaxed); }
    void incKvScanBatches() { kv_scan_batches_.fetch_add(1, std::memory_order_relaxed); }

    // Store
    void incStoreFailures() { store_failures_.fetch_add(1, std::memory_order_relaxed); }
    void incStoreTimeouts() { store_timeouts_.fetch_add(1, std::memory_order_relaxed); }
    void incRedisPingSuccess() { redis_ping_success_.fetch_add(1, std::memory_order_relaxed); }
    void incRedisPingFailure() { redis_ping_failure_.fetch_add(1, std::memory_order_relaxed); }

    nlohmann::json snapshot() const {
        auto load = [](const std::atomic<unsigned long long>& c) {
            return c.load(std::memory_order_relaxed);
        };

        nlohmann::json j;
        j["http_requests_total"] = load(http_requests_total_);
        j["http_requests_by_route"] = {
            {"health", load(http_requests_health_)},
            {"metrics", load(http_requests_metrics_)},
            {"key_get", load(http_requests_key_get_)},
            {"key_set", load(http_requests_key_set_)},
            {"key_delete", load(http_requests_key_delete_)},
            {"key_list", load(http_requests_key_list_)},
            {"other", load(http_requests_other_)},
        };
        j["auth_rejections"] = {
            {"missing", load(auth_missing_)},
            {"invalid", load(auth_invalid_)},
        };
        j["kv"] = {
            {"get_hits", load(kv_get_hits_)},
            {"get_misses", load(kv_get_misses_)},
            {"sets", load(kv_sets_)},
            {"delete_hits", load(kv_delete_hits_)},
            {"delete_misses", load(kv_delete_misses_)},
            {"scan_batches", load(kv_scan_batches_)},
        };
        j["store"] = {
            {"failures", load(store_failures_)},
            {"timeouts", load(store_timeouts_)},
            {"ping_success", load(redis_ping_success_)},
            {"ping_failure", load(redis_ping_failure_)},
        };
        return j;
    }

private:
    // HTTP
    std::atomic<unsigned long long> http_requests_total_{0};
    std::atomic<unsigned long long> http_requests_health_{0};
    std::atomic<unsigned long long> http_requests_metrics_{0};
    std::atomic<unsigned long long> http_requests_key_get_{0};
    std::atomic<unsigned long long> http_requests_key_set_{0};
    std::atomic<unsigned long long> http_requests_key_delete_{0};
    std::atomic<unsigned long long> http_requests_key_list_{0};
    std::atomic<unsigned long long> http_requests_other_{0};

    // Auth
    std::atomic<unsigned long long> auth_missing_{0};
    std::atomic<unsigned long long> auth_invalid_{0};

    // KV
    std::atomic<unsigned long long> kv_get_hits_{0};
    std::atomic<unsigned long long> kv_get_misses_{0};
    std::atomic<unsigned long long> kv_sets_{0};
    std::atomic<unsigned long long> kv_delete_hits_{0};
    std::atomic<unsigned long long> kv_delete_misses_{0};
    std::atomic<unsigned long long> kv_scan_batches_{0};

    // Store
    std::atomic<unsigned long long> store_failures_{0};
    std::atomic<unsigned long long> store_timeouts_{0};
    std::atomic<unsigned long long> redis_ping_success_{0};
    std::atomic<unsigned long long> redis_ping_failure_{0};
};
