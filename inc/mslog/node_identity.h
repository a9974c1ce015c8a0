#ifndef INC_MSLOG_NODE_IDENTITY_H_
#define INC_MSLOG_NODE_IDENTITY_H_

#include <cstdint>
#include <string>

namespace mslog {

/** Pack a 6-byte MAC into a node id, mac[0] in bits 40..47. */
uint64_t nodeIdFromMac(const uint8_t mac[6]);

/**
 * Render the low 48 bits of a node id as "AA:BB:CC:DD:EE:FF", most
 * significant byte first. Bits above 47 are ignored.
 */
std::string formatNodeId(uint64_t node_id);

/** Inverse of formatNodeId. Accepts upper or lower case hex. */
bool parseNodeId(const std::string& text, uint64_t* out_node_id);

/** ISO-8601 UTC ("2024-05-01T12:00:00"), or `none_text` for timestamp 0. */
std::string formatTimestamp(uint32_t timestamp, const char* none_text = "N/A");

}  // namespace mslog

#endif  // INC_MSLOG_NODE_IDENTITY_H_
