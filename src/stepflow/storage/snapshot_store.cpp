#include "stepflow/storage/snapshot_store.hpp"

#include "stepflow/util/log.hpp"

#include <format>
#include <fstream>

namespace stepflow {

SnapshotStore::SnapshotStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
}

auto SnapshotStore::path_for(const PlanId& plan_id) const
    -> std::filesystem::path {
  return directory_ / std::format("plan_{}.json", plan_id);
}

auto SnapshotStore::save(const PlanId& plan_id, const nlohmann::json& snapshot)
    -> Result<void> {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    log::error("Cannot create snapshot directory {}: {}", directory_.string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }

  auto target = path_for(plan_id);
  auto tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      log::error("Cannot write snapshot {}", tmp.string());
      return fail(Error::FileOpenFailed);
    }
    out << snapshot.dump(2);
    if (!out.good()) {
      log::error("Short write on snapshot {}", tmp.string());
      return fail(Error::FileOpenFailed);
    }
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    log::error("Cannot replace snapshot {}: {}", target.string(), ec.message());
    std::filesystem::remove(tmp, ec);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto SnapshotStore::load(const PlanId& plan_id)
    -> Result<std::optional<nlohmann::json>> {
  auto path = path_for(plan_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::optional<nlohmann::json>{};
  }

  std::ifstream in(path);
  if (!in.is_open()) {
    log::warn("Cannot open snapshot {}", path.string());
    return fail(Error::FileOpenFailed);
  }
  auto parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded()) {
    log::warn("Corrupt snapshot {}", path.string());
    return fail(Error::ParseError);
  }
  return std::optional<nlohmann::json>{std::move(parsed)};
}

auto SnapshotStore::remove(const PlanId& plan_id) -> void {
  std::error_code ec;
  std::filesystem::remove(path_for(plan_id), ec);
  if (ec) {
    log::warn("Cannot remove snapshot for plan {}: {}", plan_id, ec.message());
  }
}

}  // namespace stepflow
