#pragma once

#include <compare>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace shepherd {

struct TaskTag {};
struct ClaimTag {};
struct SecretTag {};

// Strongly typed string id; the tag keeps task, claim and secret names apart.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }
  [[nodiscard]] auto size() const -> std::size_t { return value_.size(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs)
      -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using ClaimName = TypedId<ClaimTag>;
using SecretName = TypedId<SecretTag>;

// Child resource names are derived from the task id so that a retried create
// lands on the same object.
[[nodiscard]] inline auto claim_name_for(const TaskId& task_id) -> ClaimName {
  return ClaimName{task_id.str()};
}

[[nodiscard]] inline auto secret_name_for(const TaskId& task_id)
    -> SecretName {
  return SecretName{std::format("{}-token", task_id.value())};
}

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace shepherd

template <typename Tag>
struct std::hash<shepherd::TypedId<Tag>> {
  auto operator()(const shepherd::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<shepherd::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const shepherd::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
