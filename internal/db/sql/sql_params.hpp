#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace offline::db::sql {

/*
  Parameter abstraction for statements assembled at runtime
  (optional scan filters). SQLite binds positionally: ? ? ?
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

/*
  Accumulates "column op ?" terms and their parameters in binding order.
*/
class WhereClause {
 public:
  void Add(std::string term, Param param) {
    terms_.push_back(std::move(term));
    params_.push_back(std::move(param));
  }

  // Term without a parameter (e.g. "resolved_at_ms IS NULL").
  void AddRaw(std::string term) {
    terms_.push_back(std::move(term));
  }

  std::string Sql() const {
    if (terms_.empty()) return {};
    std::string out = " WHERE ";
    for (std::size_t i = 0; i < terms_.size(); ++i) {
      if (i) out += " AND ";
      out += terms_[i];
    }
    return out;
  }

  Params& MutableParams() {
    return params_;
  }

 private:
  std::vector<std::string> terms_;
  Params                   params_;
};

}
