/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_TPU_LEADER_SERVICE_HPP
#define TPU_TURBO_TPU_LEADER_SERVICE_HPP

#include <chrono>
#include <condition_variable>
#include <thread>
#include <tt/tpu/leader-cache.hpp>
#include <tt/tpu/recent-slots.hpp>

namespace tpu_turbo::tpu {
    // Keeps the leader cache aligned with the cluster's progress from a background thread.
    struct leader_service {
        using clock = std::chrono::steady_clock;
        static constexpr std::chrono::seconds refresh_interval { 1 };
        static constexpr std::chrono::minutes contact_map_refresh_interval { 5 };

        // Queries the current slot, loads the cache, optionally subscribes to slot updates and starts the refresh thread.
        static std::unique_ptr<leader_service> load(solana::cluster &cluster, bool subscribe=true, bool start_thread=true);

        leader_service(solana::cluster &cluster, slot_t current_slot, std::unique_ptr<leader_cache> &&cache);
        ~leader_service();

        void start();
        void stop();
        // A single refresh iteration; every step is independently fallible and keeps the previous state on failure.
        void refresh(clock::time_point now=clock::now());
        void record_slot(const solana::slot_update &upd);
        void subscribe();

        std::vector<socket_address> leader_sockets(uint64_t fanout_slots) const
        {
            return _cache->leader_sockets(fanout_slots);
        }

        slot_t estimate_slot() const
        {
            return _slots.estimate();
        }

        const leader_cache &cache() const
        {
            return *_cache;
        }

        solana::cluster &cluster()
        {
            return _cluster;
        }
    private:
        solana::cluster &_cluster;
        recent_slots _slots;
        std::unique_ptr<leader_cache> _cache;
        clock::time_point _last_contacts_refresh = clock::now();
        std::unique_ptr<solana::subscription> _subscription {};
        alignas(mutex::padding) mutex::unique_lock::mutex_type _stop_mutex {};
        std::condition_variable _stop_cv {};
        bool _stop_requested = false;
        std::thread _thread {};

        void _run();
    };
}

#endif // !TPU_TURBO_TPU_LEADER_SERVICE_HPP
