#pragma once

#include "hs602/core/Expected.hpp"
#include "hs602/device/CommandDispatcher.hpp"
#include "hs602/device/Parameter.hpp"

#include <chrono>
#include <string_view>
#include <vector>

namespace hs602::device {

/**
 * @brief Read-only catalog of the settings a device exposes.
 *
 * Built once from a table and never mutated, so one registry can be shared
 * by every handle. Firmware builds that number their settings differently
 * get their own table; `defaultTable()` describes the stock HS602 firmware.
 *
 * `get`/`set` look up the descriptor, encode or decode through the value
 * codec for its kind, and delegate the exchange to a CommandDispatcher.
 * Invalid values never reach the dispatcher.
 */
class ParameterRegistry {
public:
    explicit ParameterRegistry(std::vector<Parameter> table);

    static std::vector<Parameter> defaultTable();
    static const ParameterRegistry& defaults();

    /// Fails with `Errc::unknown_parameter`.
    expected<const Parameter*> find(std::string_view name) const;

    const std::vector<Parameter>& parameters() const { return table; }

    expected<ParameterValue> get(CommandDispatcher& dispatcher, std::string_view name,
                                 std::chrono::milliseconds timeout) const;

    expected<void> set(CommandDispatcher& dispatcher, std::string_view name,
                       const ParameterValue& value, std::chrono::milliseconds timeout) const;

private:
    std::vector<Parameter> table;
};

} // namespace hs602::device
