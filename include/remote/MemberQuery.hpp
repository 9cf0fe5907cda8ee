#pragma once

#include "remote/model/Item.hpp"

#include <string>
#include <variant>

namespace lb::remote {

struct ByTitle { std::string title; };
struct ById { std::string id; };

using MemberQuery = std::variant<ByTitle, ById>;

// Throws std::invalid_argument when the lookup key is empty.
void validate(const MemberQuery& query);

[[nodiscard]] bool matches(const model::Item& item, const MemberQuery& query);

}
