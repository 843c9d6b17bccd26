#pragma once

#include <capvault/schema/ledger_event.hpp>
#include <functional>

namespace capvault::execution {

using event_sink_t =
    std::function<void(const capvault::schema::ledger_event_t& event)>;

}  // namespace capvault::execution
