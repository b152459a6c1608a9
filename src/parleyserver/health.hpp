#pragma once

#include <memory>
#include <string>

#include "broker/broker.hpp"

namespace parley {

// GET <path>[?conversation=<id>] -> broker statistics as JSON.
// Must be called before app().run().
void register_health_route(const std::string& path, std::shared_ptr<Broker> broker);

} // namespace parley
