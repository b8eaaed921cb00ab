/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file zia.hpp
 * @brief zia - UDP over WebSocket tunnel
 *
 * The client accepts UDP datagrams and spreads them over a pool of
 * WebSocket connections, one binary message per datagram. The server
 * unwraps them and relays to a UDP upstream; replies travel back the same
 * way. Frames are encoded and decoded in-tree (RFC 6455 subset: binary
 * messages, close, masking), no WebSocket library involved.
 *
 * Usage:
 *   #include "zia.hpp"
 *
 *   int main(int argc, char* argv[]) {
 *     int exit_code = 0;
 *     auto config = zia::parse_client_config(argc, argv, exit_code);
 *     if (!config) return exit_code;
 *     zia::Client client(config.value());
 *     return client.run() ? 0 : 1;
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef ZIA_HPP_
#define ZIA_HPP_

#include "zia/client.hpp"
#include "zia/config.hpp"
#include "zia/connection_pool.hpp"
#include "zia/frame.hpp"
#include "zia/handshake.hpp"
#include "zia/log.hpp"
#include "zia/peer_address.hpp"
#include "zia/read_connection.hpp"
#include "zia/server.hpp"
#include "zia/stream.hpp"
#include "zia/task_group.hpp"
#include "zia/tls.hpp"
#include "zia/upstream.hpp"
#include "zia/url.hpp"
#include "zia/utils.hpp"
#include "zia/vocabulary.hpp"
#include "zia/websocket.hpp"
#include "zia/write_pool.hpp"

#endif  // ZIA_HPP_
