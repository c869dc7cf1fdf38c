/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/logger.hpp>
#include <tt/tpu/leader-service.hpp>

namespace tpu_turbo::tpu {
    static slot_t saturating_sub(const slot_t a, const slot_t b)
    {
        return a > b ? a - b : 0;
    }

    std::unique_ptr<leader_service> leader_service::load(solana::cluster &cluster, const bool subscribe, const bool start_thread)
    {
        const auto current_slot = cluster.slot(solana::commitment::processed);
        auto svc = std::make_unique<leader_service>(cluster, current_slot, leader_cache::load(cluster, current_slot));
        if (subscribe)
            svc->subscribe();
        if (start_thread)
            svc->start();
        return svc;
    }

    leader_service::leader_service(solana::cluster &cluster, const slot_t current_slot, std::unique_ptr<leader_cache> &&cache)
        : _cluster { cluster }, _slots { current_slot }, _cache { std::move(cache) }
    {
        if (!_cache)
            throw error("leader_service requires a loaded leader cache");
    }

    leader_service::~leader_service()
    {
        stop();
        _subscription.reset();
    }

    void leader_service::subscribe()
    {
        _subscription = _cluster.subscribe_slot_updates([this](const auto &upd) {
            record_slot(upd);
        });
        if (!_subscription)
            logger::info("the cluster does not provide slot update notifications; relying on the initial slot and schedule refreshes");
    }

    void leader_service::start()
    {
        if (_thread.joinable())
            throw error("the leader service has already been started");
        {
            mutex::scoped_lock lk { _stop_mutex };
            _stop_requested = false;
        }
        _thread = std::thread { [this] { _run(); } };
    }

    void leader_service::stop()
    {
        {
            mutex::scoped_lock lk { _stop_mutex };
            _stop_requested = true;
        }
        _stop_cv.notify_all();
        if (_thread.joinable())
            _thread.join();
    }

    void leader_service::record_slot(const solana::slot_update &upd)
    {
        _slots.record(upd.current_slot());
    }

    void leader_service::refresh(const clock::time_point now)
    {
        if (now - _last_contacts_refresh > contact_map_refresh_interval) {
            try {
                _cache->update_contact_map(leader_cache::fetch_contact_map(_cluster));
                _last_contacts_refresh = now;
            } catch (const std::exception &ex) {
                logger::warn("failed to refresh the cluster contact info: {}", ex.what());
            }
        }

        const auto estimate = _slots.estimate();

        if (estimate >= saturating_sub(_cache->last_epoch_info_slot(), _cache->slots_in_epoch())) {
            try {
                const auto ei = _cluster.get_epoch_info();
                _cache->update_epoch_info(ei.slots_in_epoch, estimate);
            } catch (const std::exception &ex) {
                logger::warn("failed to refresh the epoch info: {}", ex.what());
            }
        }

        if (estimate >= saturating_sub(_cache->last_slot(), max_fanout_slots)) {
            try {
                auto leaders = leader_cache::fetch_slot_leaders(_cluster, estimate, _cache->slots_in_epoch());
                logger::debug("refreshed the leader schedule for slots {}-{}", estimate, estimate + leaders.size() - 1);
                _cache->update_schedule(estimate, std::move(leaders));
            } catch (const std::exception &ex) {
                logger::warn("failed to refresh the leader schedule at slot {}: {}", estimate, ex.what());
            }
        }
    }

    void leader_service::_run()
    {
        logger::debug("the leader refresh loop has started");
        for (;;) {
            {
                mutex::unique_lock lk { _stop_mutex };
                if (_stop_cv.wait_for(lk, refresh_interval, [this] { return _stop_requested; }))
                    break;
            }
            try {
                refresh();
            } catch (const std::exception &ex) {
                logger::warn("leader refresh iteration failed: {}", ex.what());
            }
        }
        logger::debug("the leader refresh loop has stopped");
    }
}
