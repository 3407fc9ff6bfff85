#pragma once

/** \file objects.hpp
 *  \brief Umbrella header for the wire object APIs.
 *
 *  This header includes:
 *   - The encode/decode contract (object/object.hpp)
 *   - Handshake enumerations (object/state.hpp)
 *   - Connection and channel records (object/connection.hpp, object/channel.hpp)
 *   - Packets and acknowledgements (object/packet.hpp)
 *   - Proof bundles (object/proofs.hpp)
 *   - Stream formatting (object/format.hpp)
 */

#include "ibcore/error.hpp"
#include "ibcore/ids.hpp"
#include "ibcore/object/object.hpp"
#include "ibcore/object/state.hpp"
#include "ibcore/object/connection.hpp"
#include "ibcore/object/channel.hpp"
#include "ibcore/object/packet.hpp"
#include "ibcore/object/proofs.hpp"
#include "ibcore/object/format.hpp"
