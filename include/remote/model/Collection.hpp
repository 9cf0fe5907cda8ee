#pragma once

#include "remote/model/Item.hpp"

#include <string>
#include <vector>

namespace lb::remote::model {

struct Collection {
    std::string id;
    std::string title;
    std::string description;

    // Membership is fetched lazily by CollectionCache and only touched under its lock.
    std::vector<Item> members;
    bool members_loaded = false;
};

}
