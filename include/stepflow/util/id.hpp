#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace stepflow {

// Tasks are keyed by the store's row id; owners by an external numeric id.
using TaskId = std::int64_t;
using OwnerId = std::int64_t;

// Phantom type tags for type-safe ID disambiguation
struct PlanTag {};
struct StepTag {};
struct WorkerTag {};

template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }
  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

  [[nodiscard]] auto size() const -> size_t { return value_.size(); }

private:
  std::string value_;
};

using PlanId = TypedId<PlanTag>;
using StepId = TypedId<StepTag>;
using WorkerId = TypedId<WorkerTag>;

namespace detail {
inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}
}  // namespace detail

inline auto generate_plan_id() -> PlanId {
  return PlanId{detail::generate_short_uuid()};
}

inline auto generate_step_id() -> StepId {
  return StepId{detail::generate_short_uuid()};
}

inline auto generate_worker_id(std::string_view prefix, int index) -> WorkerId {
  return WorkerId{std::format("{}-{}-{}", prefix, index, detail::generate_short_uuid())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace stepflow

template <typename Tag>
struct std::hash<stepflow::TypedId<Tag>> {
  auto operator()(const stepflow::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<stepflow::TypedId<Tag>> : std::formatter<std::string> {
  auto format(const stepflow::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string>::format(std::string(id.value()), ctx);
  }
};
