// SPDX-License-Identifier: Apache-2.0
#include "X11HotkeyWatcher.hpp"

#include <core/Log.hpp>
#include <input/HotkeyTracker.hpp>

#include <X11/Xlib.h>
#include <X11/XKBlib.h>

#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace pushscribe
{

namespace
{

    // Set by the X error handler when a grab is refused because another client owns the key
    std::atomic<bool> grabRefused { false };

    auto onXError(Display* /*display*/, XErrorEvent* event) -> int
    {
        if (event->error_code == BadAccess)
            grabRefused.store(true);
        else
            log::debug("X error {} (request {}.{})",
                       static_cast<int>(event->error_code),
                       static_cast<int>(event->request_code),
                       static_cast<int>(event->minor_code));
        return 0;
    }

    // NumLock (Mod2) and CapsLock must not prevent the grab from matching
    constexpr auto LockVariants = std::array<unsigned, 4> { 0u, LockMask, Mod2Mask, LockMask | Mod2Mask };

    auto toX11Mask(Modifier mods) -> unsigned
    {
        auto mask = 0u;
        if (hasModifier(mods, Modifier::Shift))
            mask |= ShiftMask;
        if (hasModifier(mods, Modifier::Ctrl))
            mask |= ControlMask;
        if (hasModifier(mods, Modifier::Alt))
            mask |= Mod1Mask;
        if (hasModifier(mods, Modifier::Super))
            mask |= Mod4Mask;
        return mask;
    }

    auto fromX11State(unsigned state) -> Modifier
    {
        auto mods = Modifier {};
        if ((state & ShiftMask) != 0)
            mods |= Modifier::Shift;
        if ((state & ControlMask) != 0)
            mods |= Modifier::Ctrl;
        if ((state & Mod1Mask) != 0)
            mods |= Modifier::Alt;
        if ((state & Mod4Mask) != 0)
            mods |= Modifier::Super;
        return mods;
    }

    // Keysym names are case sensitive ("Escape", "F9", "Page_Up"); try the usual spellings.
    auto lookupKeysym(const std::string& name) -> KeySym
    {
        auto candidates = std::vector<std::string> { name };

        auto capitalized = name;
        auto startOfWord = true;
        for (auto& ch: capitalized)
        {
            if (startOfWord)
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            startOfWord = ch == '_';
        }
        candidates.push_back(std::move(capitalized));

        auto upper = name;
        for (auto& ch: upper)
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        candidates.push_back(std::move(upper));

        for (auto const& candidate: candidates)
        {
            auto const keysym = XStringToKeysym(candidate.c_str());
            if (keysym != NoSymbol)
                return keysym;
        }
        return NoSymbol;
    }

    struct Grab
    {
        KeyCode keycode = 0;
        unsigned mask = 0;
    };

} // namespace

struct X11HotkeyWatcher::Impl
{
    Display* display = nullptr;
    Window root = 0;
    std::array<int, 2> wakePipe { -1, -1 }; // written under requestMutex
    std::jthread thread;
    bool observed = false;

    HotkeyCombo cancelCombo;
    bool hasCancelCombo = false;

    // Owned by the event thread once observe() has returned
    HotkeyTracker tracker;
    std::optional<Grab> hotkeyGrab;
    std::optional<Grab> cancelGrab;

    // Requests from other threads, applied by the event thread
    std::mutex requestMutex;
    std::optional<HotkeyCombo> pendingCombo;
    std::optional<bool> pendingArm;

    auto grab(const HotkeyCombo& combo) -> Result<Grab>
    {
        auto const keysym = lookupKeysym(combo.key);
        if (keysym == NoSymbol)
            return makeError(ErrorCode::HotkeyUnavailable, std::format("Unknown key '{}'", combo.key));

        auto const keycode = XKeysymToKeycode(display, keysym);
        if (keycode == 0)
            return makeError(ErrorCode::HotkeyUnavailable,
                             std::format("Key '{}' is not on the current keyboard layout", combo.key));

        auto const result = Grab { .keycode = keycode, .mask = toX11Mask(combo.modifiers) };

        grabRefused.store(false);
        for (auto const variant: LockVariants)
            XGrabKey(display, keycode, result.mask | variant, root, True, GrabModeAsync, GrabModeAsync);
        XSync(display, False);

        if (grabRefused.load())
        {
            ungrab(result);
            return makeError(ErrorCode::HotkeyUnavailable,
                             std::format("Hotkey '{}' is already grabbed by another application", combo.toString()));
        }

        log::debug("Grabbed '{}' (keycode {}, mask {:#x})", combo.toString(), keycode, result.mask);
        return result;
    }

    void ungrab(const Grab& target)
    {
        for (auto const variant: LockVariants)
            XUngrabKey(display, target.keycode, target.mask | variant, root);
        XSync(display, False);
    }

    void wake()
    {
        auto lock = std::lock_guard(requestMutex);
        if (wakePipe[1] == -1)
            return;
        auto const byte = char { 1 };
        auto const result = write(wakePipe[1], &byte, 1);
        static_cast<void>(result);
    }

    void applyRequests()
    {
        auto combo = std::optional<HotkeyCombo> {};
        auto arm = std::optional<bool> {};
        {
            auto lock = std::lock_guard(requestMutex);
            combo = std::exchange(pendingCombo, std::nullopt);
            arm = std::exchange(pendingArm, std::nullopt);
        }

        if (combo && *combo != tracker.combo())
        {
            auto const previous = tracker.combo();
            if (hotkeyGrab)
                ungrab(*hotkeyGrab);
            hotkeyGrab.reset();

            if (auto grabbed = grab(*combo); grabbed)
            {
                hotkeyGrab = *grabbed;
                tracker.setCombo(*combo);
                log::info("Hotkey changed to '{}'", combo->toString());
            }
            else
            {
                log::error("Cannot rebind hotkey: {}", grabbed.error());
                if (auto restored = grab(previous); restored)
                    hotkeyGrab = *restored;
                else
                    log::error("Cannot restore hotkey '{}': {}", previous.toString(), restored.error());
            }
        }

        if (arm && hasCancelCombo)
        {
            if (*arm && !cancelGrab)
            {
                if (auto grabbed = grab(cancelCombo); grabbed)
                {
                    cancelGrab = *grabbed;
                    tracker.setCancelCombo(cancelCombo);
                }
                else
                    log::warning("Cancel key unavailable: {}", grabbed.error());
            }
            else if (!*arm && cancelGrab)
            {
                ungrab(*cancelGrab);
                cancelGrab.reset();
                tracker.setCancelCombo(std::nullopt);
            }
        }
    }

    void dispatch(const XEvent& event, const HotkeyHandler& handler)
    {
        if (event.type != KeyPress && event.type != KeyRelease)
            return;

        auto const keysym = XkbKeycodeToKeysym(display, static_cast<KeyCode>(event.xkey.keycode), 0, 0);
        auto const* name = XKeysymToString(keysym);
        if (!name)
            return;

        auto const raw = RawKeyEvent {
            .key = normalizeKeyName(name),
            .pressed = event.type == KeyPress,
            .modifiers = fromX11State(event.xkey.state),
        };

        if (auto const kind = tracker.onKey(raw))
        {
            log::trace("Hotkey {} ({})", hotkeyKindName(*kind), raw.key);
            handler(HotkeyEvent { .kind = *kind });
        }
    }

    void run(std::stop_token stopToken, HotkeyHandler handler)
    {
        auto fds = std::array<struct pollfd, 2> {};
        fds[0] = { .fd = ConnectionNumber(display), .events = POLLIN, .revents = 0 };
        fds[1] = { .fd = wakePipe[0], .events = POLLIN, .revents = 0 };

        while (!stopToken.stop_requested())
        {
            // Xlib may have buffered events while grabbing; drain them before blocking
            while (XPending(display) > 0)
            {
                auto event = XEvent {};
                XNextEvent(display, &event);
                dispatch(event, handler);
            }

            auto const pollResult = ::poll(fds.data(), fds.size(), -1);
            if (pollResult < 0)
            {
                if (errno == EINTR)
                    continue;
                log::error("Hotkey watcher poll failed: {}", std::strerror(errno));
                break;
            }

            if ((fds[1].revents & POLLIN) != 0)
            {
                auto buf = char {};
                while (read(wakePipe[0], &buf, 1) > 0)
                    ;
                if (stopToken.stop_requested())
                    break;
                applyRequests();
            }
        }
    }

    void closeDisplay()
    {
        if (!display)
            return;
        if (hotkeyGrab)
            ungrab(*hotkeyGrab);
        if (cancelGrab)
            ungrab(*cancelGrab);
        hotkeyGrab.reset();
        cancelGrab.reset();
        XCloseDisplay(display);
        display = nullptr;
    }

    void closePipe()
    {
        auto lock = std::lock_guard(requestMutex);
        for (auto& fd: wakePipe)
        {
            if (fd != -1)
                close(fd);
            fd = -1;
        }
    }
};

X11HotkeyWatcher::X11HotkeyWatcher(HotkeyCombo combo, std::optional<HotkeyCombo> cancelCombo):
    _impl(std::make_unique<Impl>())
{
    _impl->tracker.setCombo(std::move(combo));
    if (cancelCombo)
    {
        _impl->cancelCombo = std::move(*cancelCombo);
        _impl->hasCancelCombo = true;
    }
}

X11HotkeyWatcher::~X11HotkeyWatcher()
{
    stop();
}

auto X11HotkeyWatcher::observe(HotkeyHandler handler) -> VoidResult
{
    if (_impl->observed)
        return makeError(ErrorCode::InvalidArgument, "Hotkey watcher has already been started");
    _impl->observed = true;

    _impl->display = XOpenDisplay(nullptr);
    if (!_impl->display)
        return makeError(ErrorCode::HotkeyUnavailable, "Cannot open X display (is DISPLAY set?)");
    _impl->root = DefaultRootWindow(_impl->display);

    XSetErrorHandler(onXError);

    // Desktop tools spawned later must not hold the X connection open
    fcntl(ConnectionNumber(_impl->display), F_SETFD, FD_CLOEXEC);

    // Held keys then report repeated KeyPress without synthetic KeyRelease in between
    auto detectableSupported = Bool { False };
    XkbSetDetectableAutoRepeat(_impl->display, True, &detectableSupported);
    if (!detectableSupported)
        log::warning("X server does not support detectable auto-repeat; holding the hotkey may flap");

    auto grabbed = _impl->grab(_impl->tracker.combo());
    if (!grabbed)
    {
        _impl->closeDisplay();
        return std::unexpected(grabbed.error());
    }
    _impl->hotkeyGrab = *grabbed;

    auto fds = std::array<int, 2> { -1, -1 };
    if (pipe2(fds.data(), O_CLOEXEC | O_NONBLOCK) == -1)
    {
        _impl->closeDisplay();
        return makeError(ErrorCode::IoError, "Failed to create hotkey watcher wake pipe");
    }
    {
        auto lock = std::lock_guard(_impl->requestMutex);
        _impl->wakePipe = fds;
    }

    _impl->thread = std::jthread([impl = _impl.get(), handler = std::move(handler)](std::stop_token stopToken) {
        log::setThreadName("hotkey");
        impl->run(stopToken, handler);
    });

    log::info("Listening for hotkey '{}'", _impl->tracker.combo().toString());
    return {};
}

void X11HotkeyWatcher::setHotkey(HotkeyCombo combo)
{
    {
        auto lock = std::lock_guard(_impl->requestMutex);
        _impl->pendingCombo = std::move(combo);
    }
    _impl->wake();
}

void X11HotkeyWatcher::setCancelArmed(bool armed)
{
    {
        auto lock = std::lock_guard(_impl->requestMutex);
        _impl->pendingArm = armed;
    }
    _impl->wake();
}

void X11HotkeyWatcher::stop()
{
    if (_impl->thread.joinable())
    {
        _impl->thread.request_stop();
        _impl->wake();
        _impl->thread.join();
    }
    _impl->closeDisplay();
    _impl->closePipe();
}

} // namespace pushscribe
