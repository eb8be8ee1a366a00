/* SPDX-License-Identifier: LGPL-3.0-only */
#include <stdexcept>

#include <linux/limits.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utmp.h>

#include "remux/CheckedErrno.hpp"
#include "remux/adt/POD.hpp"
#include "remux/system/fd.hpp"

#include "remux/system/UnixPty.hpp"

#include "remux/Log.hpp"
#define LOG(SEVERITY) remux::log::SEVERITY("system/Pty")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << name() << ": "

namespace remux::system::unix
{

Pty::Pty()
{
  fd::raw_fd MasterFD;
  fd::raw_fd SlaveFD;
  POD<char[PATH_MAX]> DeviceName;

  CheckedErrnoThrow(
    [&MasterFD, &SlaveFD, &DeviceName] {
      return ::openpty(&MasterFD, &SlaveFD, *DeviceName, nullptr, nullptr);
    },
    "openpty()",
    -1);

  Master = Handle::wrap(MasterFD);
  Slave = Handle::wrap(SlaveFD);
  Name = *DeviceName;
  LOG(debug) << "Opened " << Name << " (master: " << MasterFD
             << ", slave: " << SlaveFD << ')';
}

void Pty::setupParentSide()
{
  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "Set up as parent...");
  Slave.reset();
  IsMaster = true;
  fd::setNonBlockingCloseOnExec(Master);
}

void Pty::setupChildrenSide()
{
  Master.reset();
  CheckedErrnoThrow(
    [this] { return ::login_tty(Slave.get()); }, "login_tty() in child", -1);
  // login_tty() dup2()ed the slave onto the standard streams.
  (void)Slave.release();
}

std::string Pty::read(std::size_t Bytes)
{
  if (!isMaster() || hungUp())
    return {};

  std::string Return(Bytes, '\0');
  auto ReadBytes = CheckedErrno(
    [FD = Master.get(), &Return] {
      return ::read(FD, Return.data(), Return.size());
    },
    -1);
  if (!ReadBytes)
  {
    std::errc EC = static_cast<std::errc>(ReadBytes.getError().value());
    if (EC == std::errc::interrupted /* EINTR */ ||
        EC == std::errc::operation_would_block /* EWOULDBLOCK */ ||
        EC == std::errc::resource_unavailable_try_again /* EAGAIN */)
      return {};

    // Linux reports EIO on the master once every slave descriptor closed.
    if (EC == std::errc::io_error /* EIO */)
    {
      REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "Hung up");
      HungUp = true;
      return {};
    }
    throw std::system_error{std::make_error_code(EC), "read(" + name() + ')'};
  }

  if (ReadBytes.get() == 0)
    HungUp = true;
  Return.resize(static_cast<std::size_t>(ReadBytes.get()));
  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(data)
                  << "Read " << Return.size() << " bytes");
  return Return;
}

std::size_t Pty::write(std::string_view Data)
{
  if (!isMaster() || hungUp())
    return 0;

  std::size_t Written = 0;
  while (!Data.empty())
  {
    auto WriteBytes = CheckedErrno(
      [FD = Master.get(), Data] {
        return ::write(FD, Data.data(), Data.size());
      },
      -1);
    if (!WriteBytes)
    {
      std::errc EC = static_cast<std::errc>(WriteBytes.getError().value());
      if (EC == std::errc::interrupted /* EINTR */)
        continue;
      if (EC == std::errc::operation_would_block /* EWOULDBLOCK */ ||
          EC == std::errc::resource_unavailable_try_again /* EAGAIN */)
      {
        LOG_WITH_IDENTIFIER(warn)
          << "Input queue full, " << Data.size() << " bytes dropped";
        break;
      }
      if (EC == std::errc::io_error /* EIO */)
      {
        HungUp = true;
        break;
      }
      throw std::system_error{std::make_error_code(EC),
                              "write(" + name() + ')'};
    }

    Written += static_cast<std::size_t>(WriteBytes.get());
    Data.remove_prefix(static_cast<std::size_t>(WriteBytes.get()));
  }
  return Written;
}

void Pty::setSize(unsigned short Rows, unsigned short Columns)
{
  if (!isMaster())
    throw std::invalid_argument{"setSize() not allowed on slave device."};

  REMUX_TRACE_LOG(LOG_WITH_IDENTIFIER(data) << "setSize(Rows=" << Rows
                                            << ", Columns=" << Columns << ')');

  POD<struct ::winsize> Size;
  Size->ws_row = Rows;
  Size->ws_col = Columns;
  CheckedErrnoThrow(
    [RawFD = Master.get(), &Size] { return ::ioctl(RawFD, TIOCSWINSZ, &Size); },
    "ioctl(PTMX, TIOCSWINSZ)",
    -1);
}

} // namespace remux::system::unix

#undef LOG_WITH_IDENTIFIER
#undef LOG
