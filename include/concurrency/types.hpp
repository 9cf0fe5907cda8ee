#pragma once

#include <cstdint>

namespace lb::upload::model { enum class Outcome : uint8_t; }

namespace lb::concurrency {

typedef upload::model::Outcome ExpectedFuture;

}
