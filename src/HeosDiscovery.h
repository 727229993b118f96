/**
 * @file HeosDiscovery.h
 * @brief Locate a HEOS device on the local network via SSDP
 */

#ifndef HEOSLINK_HEOS_DISCOVERY_H
#define HEOSLINK_HEOS_DISCOVERY_H

#include <string>

constexpr char HEOS_SSDP_TARGET[] = "urn:schemas-denon-com:device:ACT-Denon:1";
constexpr char SSDP_MULTICAST_ADDR[] = "239.255.255.250";
constexpr int SSDP_PORT = 1900;

/**
 * @brief Discover a HEOS device with an SSDP M-SEARCH
 *
 * Any HEOS device can act as the CLI endpoint for the whole system, so the
 * first responder wins. The address is taken from the LOCATION header when
 * present, otherwise from the sender.
 *
 * @param timeoutSec Timeout per attempt in seconds
 * @param retries Number of discovery attempts
 * @return Device IP as string, or empty on failure
 */
std::string discoverHeosDevice(int timeoutSec = 3, int retries = 3);

// Host part of an SSDP LOCATION URL ("http://10.0.0.5:60006/upnp/desc.xml")
std::string hostFromLocation(const std::string& location);

// Header value from an SSDP response, case-insensitive name match
std::string ssdpHeader(const std::string& response, const std::string& name);

#endif // HEOSLINK_HEOS_DISCOVERY_H
