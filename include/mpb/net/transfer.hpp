#pragma once

#include <cstdint>
#include <filesystem>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "mpb/core/types.hpp"
#include "mpb/net/connection.hpp"

namespace mpb {

// Sends the file at input to address and returns the checksum obtained under
// protocol:
//  - RemoteChecksum: send, half-close, read the single byte the peer computed.
//  - Echo: send and hash the mirrored bytes concurrently.
// Throws Error{ConnectError}, Error{IoError} or Error{ProtocolError}.
boost::asio::awaitable<uint8_t> transfer(std::filesystem::path input,
                                         tcp::endpoint address,
                                         Protocol protocol = Protocol::RemoteChecksum);

}  // namespace mpb
