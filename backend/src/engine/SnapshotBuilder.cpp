#include "engine/SnapshotBuilder.hpp"

#include <cstddef>

namespace tmax::engine
{

namespace
{

constexpr std::size_t kShortNameLength = 8;

TorrentState phase_state(TransferPhase phase)
{
    switch (phase)
    {
    case TransferPhase::CheckingFiles:
    case TransferPhase::CheckingResumeData:
        return TorrentState::Checking;
    case TransferPhase::DownloadingMetadata:
        return TorrentState::DownloadingMetadata;
    case TransferPhase::Downloading:
        return TorrentState::Downloading;
    case TransferPhase::Finished:
    case TransferPhase::Seeding:
        return TorrentState::Seeding;
    default:
        return TorrentState::Queued;
    }
}

} // namespace

TorrentState SnapshotBuilder::to_state(HandleStatus const &status)
{
    if (!status.error.empty())
    {
        return TorrentState::Error;
    }
    if (status.paused)
    {
        return TorrentState::Paused;
    }
    return phase_state(status.phase);
}

std::int64_t SnapshotBuilder::estimate_eta(HandleStatus const &status)
{
    if (status.download_rate <= 0 || status.total_wanted <= 0)
    {
        return -1;
    }
    auto const remaining = status.total_wanted - status.total_wanted_done;
    if (remaining <= 0)
    {
        return -1;
    }
    return remaining / status.download_rate;
}

TorrentSnapshot SnapshotBuilder::build_snapshot(std::string const &fingerprint,
                                                HandleStatus const &status)
{
    TorrentSnapshot snapshot;
    snapshot.fingerprint = fingerprint;
    snapshot.name = status.name.empty()
                        ? fingerprint.substr(0, kShortNameLength)
                        : status.name;
    snapshot.state = to_state(status);
    snapshot.progress = status.progress;
    snapshot.download_rate = status.download_rate;
    snapshot.upload_rate = status.upload_rate;
    snapshot.total_size = status.total_wanted;
    snapshot.total_downloaded = status.total_wanted_done;
    snapshot.total_uploaded = status.total_upload;
    snapshot.num_peers = status.num_peers;
    snapshot.num_seeds = status.num_seeds;
    snapshot.eta_seconds = estimate_eta(status);
    snapshot.save_path = status.save_path;
    if (snapshot.state == TorrentState::Error)
    {
        snapshot.error = status.error;
    }
    return snapshot;
}

char const *to_string(TorrentState state)
{
    switch (state)
    {
    case TorrentState::Queued:
        return "queued";
    case TorrentState::Checking:
        return "checking";
    case TorrentState::DownloadingMetadata:
        return "downloading_meta";
    case TorrentState::Downloading:
        return "downloading";
    case TorrentState::Seeding:
        return "seeding";
    case TorrentState::Paused:
        return "paused";
    case TorrentState::Error:
        return "error";
    }
    return "unknown";
}

} // namespace tmax::engine
