// =============================================================================
// main.cpp — keybridge-term entry point
// =============================================================================
// Wires the key core to a real session: a PTY child process as the
// transport, the VT key emulator as the emulation engine, and an SDL2 window
// as keyboard source, clipboard, and status display. Child output is read in
// a background thread, echoed to our stdout, and kept in a ScreenBuffer so
// keyboard selection can copy from it.
//
// Hot keys handled here, outside the dispatcher:
//   F12  enter / leave selection mode
//   F11  slide the (simulated) hardware keyboard closed / open
//   PgUp / PgDn  look through the scrollback (any key sent snaps back)
// =============================================================================

#include "sdl_front_end.hpp"
#include "sdl_key_source.hpp"
#include "../config/settings.hpp"
#include "../core/key_dispatcher.hpp"
#include "../input/key_character_map.hpp"
#include "../lib/errors/error.hpp"
#include "../lib/log/log.hpp"
#include "../terminal/output_decoder.hpp"
#include "../terminal/pty_transport.hpp"
#include "../terminal/screen_buffer.hpp"
#include "../terminal/vt_key_emulator.hpp"

#include <SDL2/SDL.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// =============================================================================
// Configuration
// =============================================================================

static constexpr int DEFAULT_WINDOW_WIDTH = 640;
static constexpr int DEFAULT_WINDOW_HEIGHT = 120;
static constexpr int TERM_ROWS = 24;
static constexpr int TERM_COLS = 80;

static const char *TAG = "term";

static std::string resolve_shell()
{
    const char *env = std::getenv("KEYBRIDGE_SHELL");
    if (env && std::strlen(env) > 0)
        return env;
    env = std::getenv("SHELL");
    if (env && std::strlen(env) > 0)
        return env;
    return "/bin/sh";
}

static bool hardware_keyboard_from_env()
{
    const char *env = std::getenv("KEYBRIDGE_HARD_KEYBOARD");
    return !env || std::strcmp(env, "0") != 0;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char *argv[])
{
    using namespace keybridge;

    // --- Which command runs in the session ---
    std::string command;
    std::vector<std::string> command_args;
    if (argc >= 2)
    {
        command = argv[1];
        for (int i = 2; i < argc; ++i)
            command_args.push_back(argv[i]);
    }
    else
    {
        command = resolve_shell();
    }

    // --- Preferences ---
    std::unique_ptr<EnvSettings> settings;
    try
    {
        settings = std::make_unique<EnvSettings>();
    }
    catch (const ConfigError &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // --- SDL ---
    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        std::cerr << "[keybridge] SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    SDL_Window *window = SDL_CreateWindow("keybridge", SDL_WINDOWPOS_CENTERED,
                                          SDL_WINDOWPOS_CENTERED, DEFAULT_WINDOW_WIDTH,
                                          DEFAULT_WINDOW_HEIGHT, SDL_WINDOW_SHOWN);
    if (!window)
    {
        std::cerr << "[keybridge] SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        SDL_Quit();
        return 1;
    }
    SDL_StartTextInput();

    int exit_code = 0;
    {
        SdlFrontEnd front_end(window, hardware_keyboard_from_env());

        // --- Session pieces ---
        ScreenBuffer screen(TERM_ROWS, TERM_COLS);
        OutputDecoder decoder(screen);
        PtyTransport pty;
        VtKeyEmulator emulator(pty, screen);
        QwertyKeyMap keymap;
        SessionState session;

        pty.on_disconnect = []()
        {
            SDL_Event quit_event;
            SDL_zero(quit_event);
            quit_event.type = SDL_QUIT;
            SDL_PushEvent(&quit_event);
        };

        log::LineBuilder(log::Level::Info, TAG) << "launching " << command;
        if (!pty.spawn(command, TERM_ROWS, TERM_COLS, command_args))
        {
            std::cerr << "[keybridge] Failed to spawn: " << command << "\n";
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        Collaborators peers;
        peers.transport = &pty;
        peers.emulation = &emulator;
        peers.ui = &front_end;
        peers.clipboard = &front_end;

        std::mutex screen_mutex;
        std::atomic<bool> running{true};

        try
        {
            KeyDispatcher dispatcher(session, peers, keymap, *settings, front_end);

            // --- Background thread: child output -> stdout + screen ---
            std::thread reader_thread([&]()
                                      {
                while (running.load()) {
                    std::string data = pty.read();
                    if (!data.empty()) {
                        std::cout.write(data.data(), static_cast<std::streamsize>(data.size()));
                        std::cout.flush();
                        std::lock_guard<std::mutex> lock(screen_mutex);
                        decoder.feed(data);
                    } else {
                        if (pty.child_exited()) {
                            pty.report_disconnect();
                            break;
                        }
                        std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    }
                } });

            // --- Main loop: keyboard -> dispatcher ---
            while (running.load())
            {
                SDL_Event event;
                if (SDL_WaitEventTimeout(&event, 50))
                {
                    if (event.type == SDL_QUIT)
                    {
                        running.store(false);
                        break;
                    }

                    if (event.type == SDL_KEYDOWN && !event.key.repeat)
                    {
                        if (event.key.keysym.sym == SDLK_F12)
                        {
                            std::lock_guard<std::mutex> lock(screen_mutex);
                            if (dispatcher.selecting())
                                dispatcher.cancel_selection();
                            else
                                dispatcher.start_selection();
                            continue;
                        }
                        if (event.key.keysym.sym == SDLK_F11)
                        {
                            front_end.toggle_hardware_hidden();
                            continue;
                        }
                        if (event.key.keysym.sym == SDLK_PAGEUP ||
                            event.key.keysym.sym == SDLK_PAGEDOWN)
                        {
                            std::lock_guard<std::mutex> lock(screen_mutex);
                            int page = event.key.keysym.sym == SDLK_PAGEUP ? TERM_ROWS : -TERM_ROWS;
                            front_end.scroll_by(page, screen.scrollback_size());
                            continue;
                        }
                    }

                    if (event.type == SDL_WINDOWEVENT &&
                        event.window.event == SDL_WINDOWEVENT_EXPOSED)
                        front_end.request_redraw();

                    KeyEvent key_event;
                    if (SdlKeySource::translate(event, key_event))
                    {
                        std::lock_guard<std::mutex> lock(screen_mutex);
                        if (dispatcher.on_key(key_event) == KeyOutcome::NotHandled)
                            log::LineBuilder(log::Level::Debug, TAG)
                                << "unhandled " << key_name(key_event.code);
                    }
                }

                front_end.refresh(dispatcher.meta_state(), dispatcher.selection());
            }

            running.store(false);
            reader_thread.join();
        }
        catch (const EncodingError &e)
        {
            std::cerr << e.what() << "\n";
            exit_code = 1;
        }

        pty.close();
    }

    SDL_StopTextInput();
    SDL_DestroyWindow(window);
    SDL_Quit();
    return exit_code;
}
