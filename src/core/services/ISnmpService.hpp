/**
 * @file ISnmpService.hpp
 * @brief Interface for the SNMP query service.
 *
 * This file defines the abstract interface for performing SNMP queries
 * against a single agent.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <string>
#include <vector>

namespace apcups::core {

/**
 * @brief Interface for SNMP query service.
 *
 * Calls block until the agent answers or the retry budget in the
 * configuration is exhausted. Failures are reported in the result,
 * never thrown.
 */
class ISnmpService {
public:
    virtual ~ISnmpService() = default;

    /**
     * @brief Performs an SNMP GET request.
     * @param address IP address or hostname of the SNMP agent.
     * @param oids Numeric OIDs to retrieve.
     * @param config Session configuration (community, timeout, retries).
     * @return The SNMP result.
     */
    virtual SnmpResult get(const std::string& address,
                           const std::vector<std::string>& oids,
                           const SnmpDeviceConfig& config) = 0;

    /**
     * @brief Performs one batched SNMP GET-NEXT request.
     *
     * GET-NEXT returns, for each requested OID, the first instance that
     * follows it; asking for a scalar object yields its ".0" instance.
     *
     * @param address IP address or hostname of the SNMP agent.
     * @param oids Numeric OIDs to get the next values after.
     * @param config Session configuration.
     * @return The SNMP result, varbinds in request order.
     */
    virtual SnmpResult getNext(const std::string& address,
                               const std::vector<std::string>& oids,
                               const SnmpDeviceConfig& config) = 0;
};

} // namespace apcups::core
