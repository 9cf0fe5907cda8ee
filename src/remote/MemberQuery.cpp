#include "remote/MemberQuery.hpp"

#include <stdexcept>

namespace lb::remote {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

}

void validate(const MemberQuery& query) {
    std::visit(overloaded{
        [](const ByTitle& q) {
            if (q.title.empty()) throw std::invalid_argument("Membership lookup by title needs a non-empty title");
        },
        [](const ById& q) {
            if (q.id.empty()) throw std::invalid_argument("Membership lookup by id needs a non-empty id");
        },
    }, query);
}

bool matches(const model::Item& item, const MemberQuery& query) {
    return std::visit(overloaded{
        [&](const ByTitle& q) { return item.title == q.title; },
        [&](const ById& q) { return item.id == q.id; },
    }, query);
}

}
