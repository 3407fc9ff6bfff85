#include "ibcore/object/fields.hpp"

#include <utility>

namespace ibcore::object {

void append_optional_string(rlp::Encoder& enc, const std::optional<std::string>& v) {
  if (!v) {
    enc.append_empty_list();
    return;
  }
  enc.begin_list();
  enc.append_string(*v);
  enc.end_list();
}

auto read_optional_string(const rlp::Rlp& item)
    -> std::expected<std::optional<std::string>, core::error> {
  auto list = item.items();
  if (!list) return std::unexpected(list.error());
  if (list->empty()) return std::optional<std::string>{};
  if (list->size() != 1) {
    return core::serde_failure("optional field holds more than one value", "rlp.decode");
  }
  auto s = rlp::as_string(list->front());
  if (!s) return std::unexpected(s.error());
  return std::optional<std::string>{std::move(*s)};
}

void append_string_list(rlp::Encoder& enc, const std::vector<std::string>& v) {
  enc.begin_list();
  for (const auto& s : v) enc.append_string(s);
  enc.end_list();
}

} // namespace ibcore::object
