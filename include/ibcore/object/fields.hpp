#pragma once

/** \file fields.hpp
 *  \brief Field encodings shared by several objects.
 *
 * Optional string: absent -> empty list (C0), present -> one-element list
 * holding the string. An empty string is therefore C1 80, distinct from absent.
 */

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "ibcore/error.hpp"
#include "ibcore/rlp/decode.hpp"
#include "ibcore/rlp/encode.hpp"

namespace ibcore::object {

void append_optional_string(rlp::Encoder& enc, const std::optional<std::string>& v);

auto read_optional_string(const rlp::Rlp& item)
    -> std::expected<std::optional<std::string>, core::error>;

void append_string_list(rlp::Encoder& enc, const std::vector<std::string>& v);

} // namespace ibcore::object
