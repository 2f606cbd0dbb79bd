#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace offline::db {

/*
  Lazy, finite, forward-only scan result.

  A cursor is bound to the transaction that produced it and must not be
  used after that transaction finishes. Once Next() returns nullopt the
  cursor stays exhausted; scans cannot be restarted.
*/
template <typename T>
class Cursor {
 public:
  virtual ~Cursor() = default;

  virtual std::optional<T> Next() = 0;
};

template <typename T>
std::vector<T> Drain(Cursor<T>& cursor) {
  std::vector<T> out;
  while (auto row = cursor.Next()) {
    out.push_back(std::move(*row));
  }
  return out;
}

// Cursor over rows the backend has already materialized.
template <typename T>
class VectorCursor final : public Cursor<T> {
 public:
  explicit VectorCursor(std::vector<T> rows) : rows_(std::move(rows)) {
  }

  std::optional<T> Next() override {
    if (next_ >= rows_.size()) return std::nullopt;
    return std::move(rows_[next_++]);
  }

 private:
  std::vector<T> rows_;
  std::size_t    next_ = 0;
};

} // namespace offline::db
