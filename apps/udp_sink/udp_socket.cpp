/*
   Part of the io_rings project, under the MIT License
   SPDX-License-Identifier: MIT

   Copyright (c) 2025 Mikhail Smirnov

   Permission is hereby granted, free of charge, to any person obtaining a copy
   of this software and associated documentation files (the "Software"), to deal
   in the Software without restriction, including without limitation the rights
   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
   copies of the Software, and to permit persons to whom the Software is
   furnished to do so, subject to the following conditions:

   The above copyright notice and this permission notice shall be included in all
   copies or substantial portions of the Software.

   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
   SOFTWARE.
*/

#include "common/logger.hpp" ///< for io_rings::log_error, io_rings::log_system_error
#include "udp_socket.hpp" ///< for io_rings::udp_sink::udp_socket

#include <netdb.h> ///< for addrinfo, EAI_SYSTEM, freeaddrinfo, gai_strerror, getaddrinfo
#include <sys/socket.h> ///< for AF_UNSPEC, bind, SOCK_DGRAM, socket
#include <unistd.h> ///< for close

#include <cerrno> ///< for EINVAL, errno
#include <cstring> ///< for std::memset
#include <memory> ///< for std::addressof, std::unique_ptr
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string
#include <system_error> ///< for std::error_code, std::generic_category, std::system_error

namespace io_rings::udp_sink
{

namespace
{

struct addrinfo_deleter final
{
   void operator () (addrinfo *addressInfo) const noexcept
   {
      freeaddrinfo(addressInfo);
   }
};

using addrinfo_ptr = std::unique_ptr<addrinfo, addrinfo_deleter>;

}

udp_socket::udp_socket(std::string const &bindAddress)
{
   auto const portSeparator{bindAddress.rfind(':'),};
   if ((std::string::npos == portSeparator) || (0 == portSeparator) || ((bindAddress.size() - 1) == portSeparator)) [[unlikely]]
   {
      log_error(std::source_location::current(), "[udp_sink] bind address must be in host:port form, got '{}'", bindAddress);
      throw std::system_error{std::error_code{EINVAL, std::generic_category(),}, bindAddress,};
   }
   auto const host{bindAddress.substr(0, portSeparator),};
   auto const port{bindAddress.substr(portSeparator + 1),};
   addrinfo hints;
   std::memset(std::addressof(hints), 0, sizeof(hints));
   hints.ai_family = AF_UNSPEC;
   hints.ai_socktype = SOCK_DGRAM;
   hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
   addrinfo *addressInfo{nullptr,};
   if (auto const returnCode{getaddrinfo(host.c_str(), port.c_str(), std::addressof(hints), std::addressof(addressInfo)),}; 0 != returnCode) [[unlikely]]
   {
      std::error_code const errorCode{(EAI_SYSTEM == returnCode) ? errno : EINVAL, std::generic_category(),};
      log_error(std::source_location::current(), "[udp_sink] failed to resolve '{}': {}", bindAddress, gai_strerror(returnCode));
      throw std::system_error{errorCode, bindAddress,};
   }
   addrinfo_ptr const addressInfoGuard{addressInfo,};
   std::error_code errorCode{};
   for (auto *address{addressInfo,}; nullptr != address; address = address->ai_next)
   {
      m_fileDescriptor = socket(address->ai_family, address->ai_socktype, address->ai_protocol);
      if (-1 == m_fileDescriptor) [[unlikely]]
      {
         errorCode = std::error_code{errno, std::generic_category(),};
         continue;
      }
      if (0 == bind(m_fileDescriptor, address->ai_addr, address->ai_addrlen)) [[likely]]
      {
         return;
      }
      errorCode = std::error_code{errno, std::generic_category(),};
      close(m_fileDescriptor);
      m_fileDescriptor = -1;
   }
   log_system_error("[udp_sink] failed to bind socket: ({}) - {}", errorCode);
   throw std::system_error{errorCode, bindAddress,};
}

udp_socket::~udp_socket()
{
   if ((-1 != m_fileDescriptor) && (-1 == close(m_fileDescriptor))) [[unlikely]]
   {
      log_system_error("[udp_sink] failed to close socket: ({}) - {}", errno);
   }
}

}
