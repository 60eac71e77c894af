#include "collision_resolver.hpp"

#include <utility>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace extsort::core {

namespace {
constexpr std::uint32_t kMaxSuffixIndex = 1'000'000;
}

// =============== DestinationCandidate ===============

auto DestinationCandidate::filename() const -> std::string {
    if (suffix_index == 0) {
        return stem + extension;
    }
    return fmt::format("{} ({}){}", stem, suffix_index, extension);
}

auto DestinationCandidate::from_name(std::string bucket, const std::string& name)
    -> DestinationCandidate
{
    const std::filesystem::path p{name};
    return DestinationCandidate{
        .bucket = std::move(bucket),
        .stem = p.stem().string(),
        .extension = p.extension().string(),
        .suffix_index = 0,
    };
}

// =============== Reservation ===============

Reservation::Reservation(CollisionResolver* owner, std::string bucket, std::string name,
                         std::filesystem::path path, std::uint32_t suffix_index)
    : owner_(owner)
    , bucket_(std::move(bucket))
    , name_(std::move(name))
    , path_(std::move(path))
    , suffix_index_(suffix_index)
{}

Reservation::~Reservation() {
    release();
}

Reservation::Reservation(Reservation&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr))
    , bucket_(std::move(other.bucket_))
    , name_(std::move(other.name_))
    , path_(std::move(other.path_))
    , suffix_index_(other.suffix_index_)
{}

Reservation& Reservation::operator=(Reservation&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
        bucket_ = std::move(other.bucket_);
        name_ = std::move(other.name_);
        path_ = std::move(other.path_);
        suffix_index_ = other.suffix_index_;
    }
    return *this;
}

void Reservation::commit() {
    // Файл уже на диске: имя остаётся занятым до конца прогона
    owner_ = nullptr;
}

void Reservation::release() {
    if (owner_) {
        owner_->release_(bucket_, name_);
        owner_ = nullptr;
    }
}

// =============== CollisionResolver ===============

CollisionResolver::CollisionResolver(std::filesystem::path destination_root)
    : root_(std::move(destination_root))
{}

auto CollisionResolver::bucket_state_(const std::string& bucket) -> BucketState& {
    std::lock_guard lock(buckets_mutex_);
    auto& slot = buckets_[bucket];
    if (!slot) {
        slot = std::make_unique<BucketState>();
    }
    return *slot;
}

auto CollisionResolver::reserve(const std::string& bucket, const std::string& desired_name)
    -> infra::Result<Reservation>
{
    if (bucket.empty() || desired_name.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                               "Empty bucket or file name"));
    }

    auto& state = bucket_state_(bucket);
    const auto dir = root_ / bucket;

    std::lock_guard lock(state.mutex);

    if (!state.directory_ready) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return std::unexpected(infra::error_from_errno(ec.value(),
                fmt::format("Cannot create directory {}", dir.string())));
        }
        state.directory_ready = true;
    }

    auto candidate = DestinationCandidate::from_name(bucket, desired_name);
    for (; candidate.suffix_index <= kMaxSuffixIndex; ++candidate.suffix_index) {
        auto name = candidate.filename();
        if (state.claimed.contains(name)) {
            continue;
        }

        auto path = dir / name;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(infra::error_from_errno(ec.value(),
                fmt::format("Cannot inspect {}", path.string())));
        }
        if (std::filesystem::exists(status)) {
            continue; // файл от предыдущего прогона
        }

        state.claimed.insert(name);
        if (candidate.suffix_index > 0) {
            spdlog::debug("Name collision in '{}': {} -> {}", bucket, desired_name, name);
        }
        return Reservation{this, bucket, std::move(name), std::move(path), candidate.suffix_index};
    }

    return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
        fmt::format("No free name for {} in {}", desired_name, dir.string())));
}

void CollisionResolver::release_(const std::string& bucket, const std::string& name) {
    auto& state = bucket_state_(bucket);
    std::lock_guard lock(state.mutex);
    state.claimed.erase(name);
}

auto CollisionResolver::claimed_count(const std::string& bucket) const -> std::size_t {
    const BucketState* state = nullptr;
    {
        std::lock_guard lock(buckets_mutex_);
        auto it = buckets_.find(bucket);
        if (it == buckets_.end()) return 0;
        state = it->second.get();
    }
    std::lock_guard lock(state->mutex);
    return state->claimed.size();
}

} // namespace extsort::core
