#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include "infra/error_handler/error.hpp"

namespace extsort::core {

class CollisionResolver;

// Кандидат на имя в папке назначения; живёт только внутри reserve()
struct DestinationCandidate {
    std::string bucket;
    std::string stem;
    std::string extension;     // с точкой, может быть пустым
    std::uint32_t suffix_index = 0;

    // "name.ext", "name (1).ext", "name (2).ext", ...
    [[nodiscard]] auto filename() const -> std::string;

    [[nodiscard]] static auto from_name(std::string bucket, const std::string& name)
        -> DestinationCandidate;
};

/// Захваченное имя в папке назначения.
///
/// Пока объект жив, ни один другой reserve() в той же папке это имя не вернёт.
/// commit() фиксирует имя за созданным файлом; если объект разрушается без
/// commit(), имя возвращается в свободные.
class Reservation {
public:
    Reservation() = default;
    ~Reservation();

    Reservation(Reservation&& other) noexcept;
    Reservation& operator=(Reservation&& other) noexcept;

    Reservation(const Reservation&) = delete;
    Reservation& operator=(const Reservation&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto filename() const -> const std::string& { return name_; }
    [[nodiscard]] auto suffix_index() const -> std::uint32_t { return suffix_index_; }
    [[nodiscard]] auto active() const -> bool { return owner_ != nullptr; }

    void commit();
    void release();

private:
    friend class CollisionResolver;

    Reservation(CollisionResolver* owner, std::string bucket, std::string name,
                std::filesystem::path path, std::uint32_t suffix_index);

    CollisionResolver* owner_ = nullptr;
    std::string bucket_;
    std::string name_;
    std::filesystem::path path_;
    std::uint32_t suffix_index_ = 0;
};

// Выдаёт уникальные имена в <destination_root>/<bucket>/.
// Одна блокировка на папку: резервирования в разных папках не мешают друг другу.
class CollisionResolver {
public:
    explicit CollisionResolver(std::filesystem::path destination_root);

    CollisionResolver(const CollisionResolver&) = delete;
    CollisionResolver& operator=(const CollisionResolver&) = delete;

    /// Возвращает путь, которого нет на диске и который не зарезервирован
    /// другим незавершённым вызовом. Папка bucket создаётся при первом обращении.
    [[nodiscard]] auto reserve(const std::string& bucket, const std::string& desired_name)
        -> infra::Result<Reservation>;

    // Число имён, занятых в текущем прогоне (резервы и созданные файлы)
    [[nodiscard]] auto claimed_count(const std::string& bucket) const -> std::size_t;

private:
    friend class Reservation;

    struct BucketState {
        mutable std::mutex mutex;
        std::unordered_set<std::string> claimed;
        bool directory_ready = false;
    };

    auto bucket_state_(const std::string& bucket) -> BucketState&;
    void release_(const std::string& bucket, const std::string& name);

    std::filesystem::path root_;
    mutable std::mutex buckets_mutex_;
    std::unordered_map<std::string, std::unique_ptr<BucketState>> buckets_;
};

} // namespace extsort::core
