#pragma once

/** \file format.hpp
 *  \brief Human-readable rendering of wire objects (diagnostics and tools only).
 *
 * Byte fields print as lower-case hex with a 0x prefix, optional fields as
 * "none" or the quoted value.
 */

#include <ostream>

#include "ibcore/object/channel.hpp"
#include "ibcore/object/connection.hpp"
#include "ibcore/object/packet.hpp"
#include "ibcore/object/proofs.hpp"
#include "ibcore/object/state.hpp"

namespace ibcore::object {

std::ostream& operator<<(std::ostream& os, ConnectionState s);
std::ostream& operator<<(std::ostream& os, ChannelOrdering o);
std::ostream& operator<<(std::ostream& os, const ConnectionCounterparty& v);
std::ostream& operator<<(std::ostream& os, const Version& v);
std::ostream& operator<<(std::ostream& os, const ConnectionEnd& v);
std::ostream& operator<<(std::ostream& os, const ChannelCounterparty& v);
std::ostream& operator<<(std::ostream& os, const ChannelEnd& v);
std::ostream& operator<<(std::ostream& os, const Packet& v);
std::ostream& operator<<(std::ostream& os, const PacketAck& v);
std::ostream& operator<<(std::ostream& os, const ObjectProof& v);
std::ostream& operator<<(std::ostream& os, const ProofBundle& v);

} // namespace ibcore::object
