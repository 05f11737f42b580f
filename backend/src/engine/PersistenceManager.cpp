#include "engine/PersistenceManager.hpp"

#include "engine/TorrentUtils.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <charconv>
#include <limits>
#include <string_view>

namespace tmax::engine
{

namespace
{

constexpr char const *kDownloadPathKey = "downloadPath";
constexpr char const *kListenPortKey = "listenPort";
constexpr char const *kMaxDownloadRateKey = "maxDownloadRate";
constexpr char const *kMaxUploadRateKey = "maxUploadRate";
constexpr char const *kAutoProfileKey = "autoProfile";
constexpr char const *kManualProfileKey = "manualProfile";
constexpr char const *kCheckpointTimeoutKey = "checkpointTimeoutMs";

std::optional<long long> parse_integer(std::string_view value)
{
    long long parsed = 0;
    auto const *begin = value.data();
    auto const *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

PersistenceManager::PersistenceManager(std::filesystem::path path)
    : database_(std::make_unique<storage::Database>(std::move(path)))
{
    if (!database_->is_valid())
    {
        TM_LOG_ERROR("state database {} is unavailable; running without "
                     "persistence",
                     database_->path().string());
    }
}

PersistenceManager::~PersistenceManager() = default;

bool PersistenceManager::is_valid() const noexcept
{
    return database_ && database_->is_valid();
}

bool PersistenceManager::write_resume_data(
    std::string const &fingerprint, std::vector<std::uint8_t> const &data)
{
    if (!is_valid())
    {
        return false;
    }
    return database_->update_resume_data(fingerprint, data);
}

std::optional<std::vector<std::uint8_t>>
PersistenceManager::read_resume_data(std::string const &fingerprint)
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    auto data = database_->resume_data(fingerprint);
    if (data && data->empty())
    {
        return std::nullopt;
    }
    return data;
}

bool PersistenceManager::remove_resume_data(std::string const &fingerprint)
{
    if (!is_valid())
    {
        return false;
    }
    return database_->delete_resume_data(fingerprint);
}

bool PersistenceManager::write_torrent_list(
    std::vector<TorrentListEntry> const &entries)
{
    if (!is_valid())
    {
        return false;
    }
    std::vector<storage::TorrentListRow> rows;
    rows.reserve(entries.size());
    for (auto const &entry : entries)
    {
        storage::TorrentListRow row;
        row.hash = entry.fingerprint;
        row.save_path = entry.save_path.string();
        row.name = entry.name;
        row.trackers_json = tmax::json::write_string_array(entry.trackers);
        rows.push_back(std::move(row));
    }
    return database_->replace_torrent_list(rows);
}

std::optional<std::vector<TorrentListEntry>>
PersistenceManager::read_torrent_list()
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    auto rows = database_->load_torrent_list();
    if (!rows)
    {
        return std::nullopt;
    }
    std::vector<TorrentListEntry> result;
    result.reserve(rows->size());
    for (auto &row : *rows)
    {
        auto fingerprint = canonical_fingerprint(row.hash);
        if (!fingerprint)
        {
            TM_LOG_WARN("skipping torrent list entry with bad hash '{}'",
                        row.hash);
            continue;
        }
        TorrentListEntry entry;
        entry.fingerprint = std::move(*fingerprint);
        entry.save_path = std::filesystem::path(row.save_path);
        entry.name = std::move(row.name);
        entry.trackers = tmax::json::read_string_array(row.trackers_json);
        result.push_back(std::move(entry));
    }
    return result;
}

EngineSettings PersistenceManager::load_settings(EngineSettings defaults) const
{
    if (!is_valid())
    {
        return defaults;
    }
    auto read_int = [this](char const *key) -> std::optional<long long>
    {
        auto value = database_->get_setting(key);
        if (!value)
        {
            return std::nullopt;
        }
        auto parsed = parse_integer(*value);
        if (!parsed)
        {
            TM_LOG_WARN("ignoring malformed setting {}='{}'", key, *value);
        }
        return parsed;
    };

    auto read_in_range = [&read_int](char const *key, long long low,
                                     long long high) -> std::optional<int>
    {
        auto value = read_int(key);
        if (!value)
        {
            return std::nullopt;
        }
        if (*value < low || *value > high)
        {
            TM_LOG_WARN("ignoring out-of-range setting {}={}", key, *value);
            return std::nullopt;
        }
        return static_cast<int>(*value);
    };
    constexpr long long kMaxRate = std::numeric_limits<int>::max();

    if (auto value = database_->get_setting(kDownloadPathKey);
        value && !value->empty())
    {
        defaults.download_path = std::filesystem::path(*value);
    }
    if (auto value = read_in_range(kListenPortKey, 1, 65535))
    {
        defaults.listen_port = *value;
    }
    if (auto value = read_in_range(kMaxDownloadRateKey, 0, kMaxRate))
    {
        defaults.max_download_rate = *value;
    }
    if (auto value = read_in_range(kMaxUploadRateKey, 0, kMaxRate))
    {
        defaults.max_upload_rate = *value;
    }
    if (auto value = read_int(kAutoProfileKey); value)
    {
        defaults.auto_profile = *value != 0;
    }
    if (auto value = database_->get_setting(kManualProfileKey); value)
    {
        defaults.manual_profile = *value;
    }
    if (auto value = read_in_range(kCheckpointTimeoutKey, 1,
                                   std::numeric_limits<int>::max()))
    {
        defaults.checkpoint_timeout = std::chrono::milliseconds(*value);
    }
    return defaults;
}

bool PersistenceManager::persist_settings(EngineSettings const &settings)
{
    if (!is_valid())
    {
        return false;
    }
    if (!database_->begin_transaction())
    {
        return false;
    }
    bool ok = database_->set_setting(kDownloadPathKey,
                                     settings.download_path.string()) &&
              database_->set_setting(kListenPortKey,
                                     std::to_string(settings.listen_port)) &&
              database_->set_setting(
                  kMaxDownloadRateKey,
                  std::to_string(settings.max_download_rate)) &&
              database_->set_setting(kMaxUploadRateKey,
                                     std::to_string(settings.max_upload_rate)) &&
              database_->set_setting(kAutoProfileKey,
                                     settings.auto_profile ? "1" : "0") &&
              database_->set_setting(kManualProfileKey,
                                     settings.manual_profile) &&
              database_->set_setting(
                  kCheckpointTimeoutKey,
                  std::to_string(settings.checkpoint_timeout.count()));
    if (!ok)
    {
        database_->rollback_transaction();
        return false;
    }
    return database_->commit_transaction();
}

} // namespace tmax::engine
