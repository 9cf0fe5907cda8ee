#pragma once

#include <cstdint>

namespace lb::upload::model {

enum class Outcome : uint8_t { Uploaded, Skipped, Failed };

}
