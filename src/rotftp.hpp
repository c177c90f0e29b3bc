/*
 * Copyright (C) 2026 Dan Arrhenius <dan@ultramarin.se>
 *
 * This file is part of rotftpd
 *
 * rotftpd is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#ifndef ROTFTP_HPP
#define ROTFTP_HPP

#include <rotftp/Log.hpp>
#include <rotftp/IpAddr.hpp>
#include <rotftp/Connection.hpp>
#include <rotftp/SocketConnection.hpp>
#include <rotftp/Payload.hpp>
#include <rotftp/Packet.hpp>
#include <rotftp/TransferSession.hpp>
#include <rotftp/Server.hpp>

#endif
