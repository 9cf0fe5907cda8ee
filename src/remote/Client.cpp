#include "remote/Client.hpp"
#include "util/errors.hpp"

namespace lb::remote {

std::string to_string(const Permission p) {
    switch (p) {
    case Permission::Read: return "read";
    case Permission::Write: return "write";
    case Permission::Delete: return "delete";
    }
    return "read";
}

Permission permissionFromString(const std::string& s) {
    if (s == "read") return Permission::Read;
    if (s == "write") return Permission::Write;
    if (s == "delete") return Permission::Delete;
    throw ConfigurationError("Unknown permission level: '" + s + "'");
}

}
