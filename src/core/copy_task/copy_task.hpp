#pragma once

#include <stop_token>
#include "core/outcome/outcome.hpp"
#include "core/collision_resolver/collision_resolver.hpp"
#include "infra/config/config.hpp"

namespace extsort::core {

// Копирование одного файла: папка по расширению -> свободное имя -> копия с retry.
class CopyTask {
public:
    CopyTask(FileEntry entry, const infra::RunConfig& config, CollisionResolver& resolver);

    [[nodiscard]] auto run(std::stop_token st = {}) -> CopyOutcome;

private:
    [[nodiscard]] auto on_error_(const infra::Error& err, int retries, bool cancelled) const
        -> CopyOutcome;

    FileEntry entry_;
    const infra::RunConfig& config_;
    CollisionResolver& resolver_;
};

} // namespace extsort::core
