#include "rus/upload/registry.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace rus::upload {
namespace fs = std::filesystem;

namespace {

constexpr auto kInfoExtension = ".info";

std::int64_t to_millis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point from_millis(std::int64_t ms) {
    return Clock::time_point{std::chrono::milliseconds{ms}};
}

nlohmann::json to_json(const Upload& upload) {
    nlohmann::json metadata = nlohmann::json::array();
    for (const auto& [key, value] : upload.metadata) {
        metadata.push_back(nlohmann::json::array({key, value}));
    }

    return {
        {"id", upload.id},
        {"length", upload.total_length ? nlohmann::json(*upload.total_length) : nlohmann::json(nullptr)},
        {"offset", upload.offset},
        {"is_partial", upload.is_partial},
        {"is_final", upload.is_final},
        {"parent_ids", upload.parent_ids},
        {"created_at", to_millis(upload.created_at)},
        {"expires_at", upload.expires_at ? nlohmann::json(to_millis(*upload.expires_at)) : nlohmann::json(nullptr)},
        {"metadata", metadata},
    };
}

Upload upload_from_json(const nlohmann::json& json) {
    Upload upload;
    upload.id = json.at("id").get<std::string>();

    const auto& length = json.at("length");
    if (!length.is_null()) {
        upload.total_length = length.get<std::uint64_t>();
    }

    upload.offset = json.at("offset").get<std::uint64_t>();
    upload.is_partial = json.value("is_partial", false);
    upload.is_final = json.value("is_final", false);
    upload.parent_ids = json.value("parent_ids", std::vector<std::string>{});
    upload.created_at = from_millis(json.at("created_at").get<std::int64_t>());

    const auto expires = json.find("expires_at");
    if (expires != json.end() && !expires->is_null()) {
        upload.expires_at = from_millis(expires->get<std::int64_t>());
    }

    for (const auto& pair : json.value("metadata", nlohmann::json::array())) {
        upload.metadata.emplace_back(pair.at(0).get<std::string>(), pair.at(1).get<std::string>());
    }

    return upload;
}

} // namespace

UploadRegistry::UploadRegistry()
    : UploadRegistry(Options{}) {
}

UploadRegistry::UploadRegistry(Options options)
    : options_(std::move(options))
    , rng_(std::random_device{}()) {
    if (!options_.now) {
        options_.now = [] { return Clock::now(); };
    }
    load_existing();
}

Result<Upload> UploadRegistry::create(Metadata metadata,
                                      std::optional<std::uint64_t> total_length,
                                      bool is_partial) {
    std::unique_lock lock(mutex_);

    Upload upload;
    upload.id = generate_id();
    upload.total_length = total_length;
    upload.is_partial = is_partial;
    upload.created_at = options_.now();
    upload.expires_at = expiry_from(upload.created_at);
    upload.metadata = std::move(metadata);

    return insert(std::move(upload));
}

Result<Upload> UploadRegistry::create_final(const std::vector<std::string>& parent_ids,
                                            Metadata metadata,
                                            std::uint64_t total_length) {
    std::unique_lock lock(mutex_);

    Upload upload;
    upload.id = generate_id();
    upload.total_length = total_length;
    upload.is_final = true;
    upload.parent_ids = parent_ids;
    upload.created_at = options_.now();
    upload.expires_at = expiry_from(upload.created_at);
    upload.metadata = std::move(metadata);

    return insert(std::move(upload));
}

Result<Upload> UploadRegistry::get(const std::string& id) const {
    std::shared_lock lock(mutex_);

    if (auto known = check_known(id); known.is_error()) {
        return Err<Upload>(known.error());
    }

    auto it = uploads_.find(id);
    if (it == uploads_.end() || it->second.is_expired(options_.now())) {
        return fail<Upload>(ErrorKind::NotFound, "Upload not found: " + id);
    }
    return Ok(it->second);
}

Result<Upload> UploadRegistry::advance_offset(const std::string& id, std::uint64_t new_offset) {
    std::unique_lock lock(mutex_);

    auto found = find_live(id);
    if (found.is_error()) {
        return Err<Upload>(found.error());
    }
    const Upload& current = found.value()->second;

    if (new_offset < current.offset) {
        return Err<Upload>(Error(ErrorKind::InvalidOffset,
            "Offset may not move backwards (" + std::to_string(current.offset) +
            " -> " + std::to_string(new_offset) + ")")
            .with_progress(current.offset, current.total_length));
    }

    if (new_offset != current.offset &&
        (!current.total_length || new_offset > *current.total_length)) {
        return Err<Upload>(Error(ErrorKind::InvalidOffset,
            "Offset " + std::to_string(new_offset) + " beyond upload length")
            .with_progress(current.offset, current.total_length));
    }

    Upload updated = current;
    updated.offset = new_offset;
    updated.expires_at = expiry_from(options_.now());

    if (auto res = persist(updated); res.is_error()) {
        return Err<Upload>(res.error());
    }

    found.value()->second = updated;
    return Ok(std::move(updated));
}

Result<Upload> UploadRegistry::declare_length(const std::string& id, std::uint64_t length) {
    std::unique_lock lock(mutex_);

    auto found = find_live(id);
    if (found.is_error()) {
        return Err<Upload>(found.error());
    }
    const Upload& current = found.value()->second;

    if (current.total_length) {
        if (*current.total_length == length) {
            return Ok(current);
        }
        return Err<Upload>(Error(ErrorKind::LengthImmutable,
            "Upload length already set to " + std::to_string(*current.total_length))
            .with_progress(current.offset, current.total_length));
    }

    if (length < current.offset) {
        return Err<Upload>(Error(ErrorKind::InvalidLength,
            "Upload length " + std::to_string(length) + " is smaller than offset " +
            std::to_string(current.offset))
            .with_progress(current.offset, current.total_length));
    }

    Upload updated = current;
    updated.total_length = length;

    if (auto res = persist(updated); res.is_error()) {
        return Err<Upload>(res.error());
    }

    found.value()->second = updated;
    return Ok(std::move(updated));
}

Result<void> UploadRegistry::mark_final(const std::string& id, const std::vector<std::string>& parent_ids) {
    std::unique_lock lock(mutex_);

    auto found = find_live(id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    const Upload& current = found.value()->second;

    if (current.is_partial || current.offset != 0) {
        return Err<void>(Error(ErrorKind::InvalidConcatenation,
            "Upload " + id + " already holds data and cannot become final"));
    }

    Upload updated = current;
    updated.is_final = true;
    updated.parent_ids = parent_ids;

    if (auto res = persist(updated); res.is_error()) {
        return res;
    }

    found.value()->second = std::move(updated);
    return Ok();
}

bool UploadRegistry::remove(const std::string& id) {
    std::unique_lock lock(mutex_);

    if (uploads_.find(id) == uploads_.end()) {
        return false;
    }
    forget(id);
    return true;
}

std::vector<std::string> UploadRegistry::sweep_expired(Clock::time_point now) {
    std::unique_lock lock(mutex_);

    std::vector<std::string> expired;
    for (const auto& [id, upload] : uploads_) {
        if (upload.is_expired(now)) {
            expired.push_back(id);
        }
    }

    for (const auto& id : expired) {
        forget(id);
    }
    return expired;
}

bool UploadRegistry::is_tombstoned(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return tombstones_.count(id) > 0;
}

bool UploadRegistry::is_corrupted(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return corrupted_.count(id) > 0;
}

std::size_t UploadRegistry::size() const {
    std::shared_lock lock(mutex_);
    return uploads_.size();
}

// ────────────────────────────────────────────────────────────
// Internals (mutex_ held by caller)
// ────────────────────────────────────────────────────────────

Result<void> UploadRegistry::check_known(const std::string& id) const {
    if (corrupted_.count(id) > 0) {
        return Err<void>(Error(ErrorKind::Corrupted, "Stored state of upload " + id + " is unreadable"));
    }
    return Ok();
}

Result<UploadRegistry::UploadMap::iterator> UploadRegistry::find_live(const std::string& id) {
    if (auto known = check_known(id); known.is_error()) {
        return Err<UploadMap::iterator>(known.error());
    }

    auto it = uploads_.find(id);
    if (it == uploads_.end() || it->second.is_expired(options_.now())) {
        return fail<UploadMap::iterator>(ErrorKind::NotFound, "Upload not found: " + id);
    }
    return Ok(it);
}

Result<Upload> UploadRegistry::insert(Upload upload) {
    if (auto res = persist(upload); res.is_error()) {
        return Err<Upload>(res.error());
    }
    uploads_.emplace(upload.id, upload);
    return Ok(std::move(upload));
}

Result<void> UploadRegistry::persist(const Upload& upload) const {
    if (!options_.persist_dir) {
        return Ok();
    }

    const auto final_path = info_path(upload.id);
    auto tmp_path = final_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        out << to_json(upload).dump(2);
        out.flush();
        if (!out) {
            return Err<void>(Error(ErrorKind::StorageUnavailable,
                "Failed to write upload state: " + tmp_path.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        return Err<void>(Error(ErrorKind::Internal,
            "Failed to commit upload state " + final_path.string() + ": " + ec.message()));
    }
    return Ok();
}

void UploadRegistry::forget(const std::string& id) {
    uploads_.erase(id);
    tombstones_.insert(id);

    if (options_.persist_dir) {
        std::error_code ec;
        fs::remove(info_path(id), ec);
        if (ec) {
            spdlog::warn("Could not remove state file for {}: {}", id, ec.message());
        }
    }
}

fs::path UploadRegistry::info_path(const std::string& id) const {
    return *options_.persist_dir / (id + kInfoExtension);
}

std::optional<Clock::time_point> UploadRegistry::expiry_from(Clock::time_point now) const {
    if (options_.expiry.count() <= 0) {
        return std::nullopt;
    }
    // Saturate instead of overflowing the clock's representation
    const auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
    if (options_.expiry >= headroom) {
        return Clock::time_point::max();
    }
    return now + options_.expiry;
}

std::string UploadRegistry::generate_id() {
    std::uniform_int_distribution<std::uint64_t> dist;

    while (true) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0')
            << std::setw(16) << dist(rng_)
            << std::setw(16) << dist(rng_);
        auto id = oss.str();

        if (uploads_.count(id) == 0 && tombstones_.count(id) == 0 && corrupted_.count(id) == 0) {
            return id;
        }
    }
}

void UploadRegistry::load_existing() {
    if (!options_.persist_dir) {
        return;
    }

    const auto& dir = *options_.persist_dir;
    fs::create_directories(dir);

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != kInfoExtension) {
            continue;
        }

        const std::string id = entry.path().stem().string();
        std::ifstream in(entry.path());
        if (!in.is_open()) {
            spdlog::error("Cannot open upload state {}", entry.path().string());
            corrupted_.insert(id);
            continue;
        }

        try {
            auto upload = upload_from_json(nlohmann::json::parse(in));
            if (upload.id != id || !is_valid_upload_id(id) ||
                (upload.total_length && upload.offset > *upload.total_length)) {
                spdlog::error("Inconsistent upload state in {}", entry.path().string());
                corrupted_.insert(id);
                continue;
            }
            uploads_.emplace(id, std::move(upload));
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("Corrupted upload state {}: {}", entry.path().string(), e.what());
            corrupted_.insert(id);
        }
    }

    spdlog::info("Loaded {} upload(s) from {} ({} corrupted)", uploads_.size(), dir.string(), corrupted_.size());
}

} // namespace rus::upload
