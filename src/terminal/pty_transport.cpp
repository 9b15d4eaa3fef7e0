// =============================================================================
// pty_transport.cpp — Transport over a local pseudo terminal (forkpty)
// =============================================================================

#include "pty_transport.hpp"
#include "../lib/errors/error.hpp"
#include "../lib/log/log.hpp"

#include <unistd.h>
#ifdef __APPLE__
#include <util.h> // macOS forkpty()
#else
#include <pty.h> // Linux forkpty()
#endif
#include <sys/ioctl.h> // struct winsize
#include <sys/wait.h>
#include <termios.h>
#include <signal.h>
#include <fcntl.h>
#include <cstring>
#include <cerrno>

namespace keybridge
{

    PtyTransport::~PtyTransport()
    {
        close();
    }

    bool PtyTransport::spawn(const std::string &command, int rows, int cols,
                             const std::vector<std::string> &args)
    {
        struct winsize ws;
        std::memset(&ws, 0, sizeof(ws));
        ws.ws_row = static_cast<unsigned short>(rows);
        ws.ws_col = static_cast<unsigned short>(cols);

        pid_t pid = forkpty(&master_fd_, nullptr, nullptr, &ws);

        if (pid < 0)
        {
            log::error("pty", std::string("forkpty failed: ") + std::strerror(errno));
            return false;
        }

        if (pid == 0)
        {
            // ---- CHILD PROCESS ----
            std::vector<const char *> argv;
            argv.push_back(command.c_str());
            for (const auto &arg : args)
                argv.push_back(arg.c_str());
            argv.push_back(nullptr);

            setenv("TERM", "xterm-256color", 1);

            execvp(command.c_str(), const_cast<char *const *>(argv.data()));
            _exit(127);
        }

        // ---- PARENT PROCESS ----
        child_pid_ = pid;
        disconnected_.store(false);

        int flags = fcntl(master_fd_, F_GETFL);
        if (flags != -1)
            fcntl(master_fd_, F_SETFL, flags | O_NONBLOCK);

        return true;
    }

    bool PtyTransport::is_connected() const
    {
        return master_fd_ >= 0 && !disconnected_.load();
    }

    void PtyTransport::write(const std::string &bytes)
    {
        if (master_fd_ < 0)
            throw TransportError("pty is not open");

        size_t written = 0;
        while (written < bytes.size())
        {
            ssize_t n = ::write(master_fd_, bytes.data() + written, bytes.size() - written);
            if (n < 0)
            {
                if (errno == EAGAIN || errno == EINTR)
                    continue;
                throw TransportError(std::string("write failed: ") + std::strerror(errno));
            }
            written += static_cast<size_t>(n);
        }
    }

    void PtyTransport::flush()
    {
        if (master_fd_ < 0)
            throw TransportError("pty is not open");
        if (tcdrain(master_fd_) < 0 && errno != EINTR)
            throw TransportError(std::string("flush failed: ") + std::strerror(errno));
    }

    void PtyTransport::report_disconnect()
    {
        if (disconnected_.exchange(true))
            return;
        log::info("pty", "session disconnected");
        if (on_disconnect)
            on_disconnect();
    }

    std::string PtyTransport::read()
    {
        if (master_fd_ < 0)
            return {};

        char buf[1024];
        ssize_t n = ::read(master_fd_, buf, sizeof(buf));
        if (n > 0)
            return std::string(buf, static_cast<size_t>(n));

        // Linux reports a hung-up slave as EIO rather than EOF
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK &&
            errno != EINTR && errno != EIO)
            log::error("pty", std::string("read failed: ") + std::strerror(errno));
        return {};
    }

    bool PtyTransport::reap(int options)
    {
        int status = 0;
        pid_t r = waitpid(child_pid_, &status, options);
        if (r == 0)
            return false;
        if (r < 0)
        {
            // ECHILD: somebody else already collected it
            log::error("pty", std::string("waitpid failed: ") + std::strerror(errno));
            exit_status_ = 127;
        }
        else if (WIFEXITED(status))
            exit_status_ = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            exit_status_ = 128 + WTERMSIG(status);

        log::LineBuilder(log::Level::Info, "pty")
            << "child " << child_pid_ << " exited with " << exit_status_;
        child_pid_ = -1;
        return true;
    }

    bool PtyTransport::child_exited()
    {
        if (child_pid_ <= 0)
            return true;
        return reap(WNOHANG);
    }

    void PtyTransport::close()
    {
        if (master_fd_ >= 0)
        {
            ::close(master_fd_);
            master_fd_ = -1;
        }
        if (child_pid_ <= 0)
            return;

        // Closing the master hangs up the slave, which ends most shells.
        ::kill(child_pid_, SIGHUP);
        for (int i = 0; i < 10; ++i)
        {
            if (reap(WNOHANG))
                return;
            usleep(10000);
        }

        log::info("pty", "child ignored SIGHUP, sending SIGKILL");
        ::kill(child_pid_, SIGKILL);
        reap(0);
    }

} // namespace keybridge
