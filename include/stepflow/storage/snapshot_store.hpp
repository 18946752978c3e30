#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/util/id.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

namespace stepflow {

// Plan snapshots as JSON files, one per plan: <dir>/plan_<plan_id>.json.
class SnapshotStore {
public:
  explicit SnapshotStore(std::filesystem::path directory);

  [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& {
    return directory_;
  }
  [[nodiscard]] auto path_for(const PlanId& plan_id) const -> std::filesystem::path;

  // Writes to a temporary file and renames it over the snapshot.
  [[nodiscard]] auto save(const PlanId& plan_id, const nlohmann::json& snapshot)
      -> Result<void>;

  // nullopt when no snapshot exists; ParseError when it is unreadable.
  [[nodiscard]] auto load(const PlanId& plan_id)
      -> Result<std::optional<nlohmann::json>>;

  auto remove(const PlanId& plan_id) -> void;

private:
  std::filesystem::path directory_;
};

}  // namespace stepflow
