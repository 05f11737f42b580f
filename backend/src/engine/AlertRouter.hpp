#pragma once

#include "engine/Events.hpp"

#include <vector>

#include <libtorrent/alert.hpp>
#include <libtorrent/alert_types.hpp>

namespace tmax::engine
{

// Maps libtorrent alerts onto BackendEvents. Alerts with no counterpart
// are logged (errors) or dropped.
class AlertRouter
{
  public:
    AlertRouter();

    std::vector<BackendEvent>
    route(std::vector<libtorrent::alert *> const &alerts);

    // DHT routing table size from the newest session_stats_alert.
    int dht_node_count() const noexcept { return dht_node_count_; }

  private:
    void handle_save_resume_data(libtorrent::save_resume_data_alert const &a,
                                 std::vector<BackendEvent> &out);
    void handle_save_resume_data_failed(
        libtorrent::save_resume_data_failed_alert const &a,
        std::vector<BackendEvent> &out);
    void handle_listen_succeeded(libtorrent::listen_succeeded_alert const &a,
                                 std::vector<BackendEvent> &out);
    void handle_listen_failed(libtorrent::listen_failed_alert const &a,
                              std::vector<BackendEvent> &out);
    void handle_session_stats(libtorrent::session_stats_alert const &a);

    int dht_nodes_metric_ = -1;
    int dht_node_count_ = 0;
};

} // namespace tmax::engine
