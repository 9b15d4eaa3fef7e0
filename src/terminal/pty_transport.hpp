#pragma once

// =============================================================================
// pty_transport.hpp — Transport over a local pseudo terminal
// =============================================================================
// Spawns a child process (a shell, or ssh to reach a remote host) on a PTY
// and exposes the master side as the key core's Transport. Output is polled
// with read() from the front end's reader thread.
// =============================================================================

#include "../core/collaborators.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace keybridge
{

    class PtyTransport : public Transport
    {
    public:
        PtyTransport() = default;
        ~PtyTransport() override;

        // Non-copyable, non-movable
        PtyTransport(const PtyTransport &) = delete;
        PtyTransport &operator=(const PtyTransport &) = delete;

        /// Spawn `command` in a new PTY of rows x cols.
        /// @return true on success
        bool spawn(const std::string &command, int rows, int cols,
                   const std::vector<std::string> &args = {});

        // --- Transport ---
        bool is_connected() const override;
        void write(const std::string &bytes) override;
        void flush() override;
        void report_disconnect() override;

        /// One non-blocking read of whatever the child has written so far.
        /// Empty when nothing is pending or the child side has hung up.
        std::string read();

        /// Reaps the child without blocking. True once it has exited, or
        /// when nothing was spawned.
        bool child_exited();

        /// Exit code of a reaped child (128 + signal when killed), -1 before.
        int exit_status() const { return exit_status_; }

        /// Close the master side, then make sure the child is gone.
        void close();

        /// Invoked once from report_disconnect().
        std::function<void()> on_disconnect;

    private:
        int master_fd_ = -1;
        int child_pid_ = -1;
        int exit_status_ = -1;

        bool reap(int options);
        std::atomic<bool> disconnected_{false};
    };

} // namespace keybridge
