#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tmax::engine
{

// A checkpoint request finished; data is the serialized resume record.
struct CheckpointSavedEvent
{
    std::string fingerprint;
    std::vector<std::uint8_t> data;
};

struct CheckpointFailedEvent
{
    std::string fingerprint;
    std::string message;
};

struct TorrentErrorEvent
{
    std::string fingerprint;
    std::string message;
    std::string source; // "file", "tracker", "torrent"
};

struct TorrentFinishedEvent
{
    std::string fingerprint;
    std::string name;
};

// The backend dropped the torrent on its own (or confirmed a remove).
struct TorrentRemovedEvent
{
    std::string fingerprint;
};

struct MetadataReceivedEvent
{
    std::string fingerprint;
    std::string name;
};

struct ListenSucceededEvent
{
    std::string endpoint;
    int port = 0;
};

struct ListenFailedEvent
{
    std::string endpoint;
    int port = 0;
    std::string message;
};

using BackendEvent =
    std::variant<CheckpointSavedEvent, CheckpointFailedEvent,
                 TorrentErrorEvent, TorrentFinishedEvent, TorrentRemovedEvent,
                 MetadataReceivedEvent, ListenSucceededEvent,
                 ListenFailedEvent>;

} // namespace tmax::engine
