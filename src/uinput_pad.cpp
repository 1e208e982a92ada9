/*
 * uinput Xbox 360 Pad Implementation
 */

#include "uinput_pad.hpp"
#include "state_model.hpp"

#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

namespace deck_relay {

namespace {

struct KeyBinding {
    Button button;
    int code;
};

// Same codes the xpad driver reports for a wired 360 pad
const KeyBinding KEY_BINDINGS[] = {
    {Button::A, BTN_A},
    {Button::B, BTN_B},
    {Button::X, BTN_X},
    {Button::Y, BTN_Y},
    {Button::LB, BTN_TL},
    {Button::RB, BTN_TR},
    {Button::Back, BTN_SELECT},
    {Button::Start, BTN_START},
    {Button::Guide, BTN_MODE},
    {Button::L3, BTN_THUMBL},
    {Button::R3, BTN_THUMBR},
};

struct AbsSetup {
    int code;
    int minimum;
    int maximum;
    int fuzz;
    int flat;
};

const AbsSetup ABS_SETUP[] = {
    {ABS_X, -32768, 32767, 16, 128},
    {ABS_Y, -32768, 32767, 16, 128},
    {ABS_RX, -32768, 32767, 16, 128},
    {ABS_RY, -32768, 32767, 16, 128},
    {ABS_Z, 0, 255, 0, 0},
    {ABS_RZ, 0, 255, 0, 0},
    {ABS_HAT0X, -1, 1, 0, 0},
    {ABS_HAT0Y, -1, 1, 0, 0},
};

// evdev Y grows downwards
int invert_axis(int16_t value) {
    int v = -static_cast<int>(value);
    return v > 32767 ? 32767 : v;
}

int hat_value(uint16_t buttons, Button negative, Button positive) {
    bool neg = (buttons & static_cast<uint16_t>(negative)) != 0;
    bool pos = (buttons & static_cast<uint16_t>(positive)) != 0;
    if (neg == pos) return 0;
    return neg ? -1 : 1;
}

void push_event(std::vector<struct input_event>& events, int type, int code, int value) {
    struct input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = static_cast<__u16>(type);
    ev.code = static_cast<__u16>(code);
    ev.value = value;
    events.push_back(ev);
}

}  // namespace

UinputPad::UinputPad(std::string device_path)
    : device_path_(std::move(device_path)) {
}

UinputPad::~UinputPad() {
    destroy();
}

bool UinputPad::create(const std::string& name) {
    destroy();
    ++create_attempts_;

    int fd = open(device_path_.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        std::cerr << "open " << device_path_ << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    bool ok = ioctl(fd, UI_SET_EVBIT, EV_KEY) >= 0 &&
              ioctl(fd, UI_SET_EVBIT, EV_ABS) >= 0 &&
              ioctl(fd, UI_SET_EVBIT, EV_SYN) >= 0;
    for (const auto& binding : KEY_BINDINGS) {
        ok = ok && ioctl(fd, UI_SET_KEYBIT, binding.code) >= 0;
    }

    for (const auto& axis : ABS_SETUP) {
        struct uinput_abs_setup abs;
        std::memset(&abs, 0, sizeof(abs));
        abs.code = static_cast<__u16>(axis.code);
        abs.absinfo.minimum = axis.minimum;
        abs.absinfo.maximum = axis.maximum;
        abs.absinfo.fuzz = axis.fuzz;
        abs.absinfo.flat = axis.flat;
        ok = ok && ioctl(fd, UI_SET_ABSBIT, axis.code) >= 0 && ioctl(fd, UI_ABS_SETUP, &abs) >= 0;
    }

    if (!ok) {
        std::cerr << "uinput: capability setup failed: " << std::strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }

    struct uinput_setup setup;
    std::memset(&setup, 0, sizeof(setup));
    setup.id.bustype = BUS_USB;
    setup.id.vendor = VENDOR_ID;
    setup.id.product = PRODUCT_ID;
    setup.id.version = 0x0110;
    std::strncpy(setup.name, name.c_str(), UINPUT_MAX_NAME_SIZE - 1);

    if (ioctl(fd, UI_DEV_SETUP, &setup) < 0 || ioctl(fd, UI_DEV_CREATE) < 0) {
        std::cerr << "uinput: device creation failed: " << std::strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }

    fd_ = fd;
    std::cout << "Created virtual controller: " << name << std::endl;
    return true;
}

bool UinputPad::ensureCreated(uint64_t now) {
    if (fd_ >= 0) {
        return true;
    }
    if (create_attempts_ > 0 && now - last_attempt_ < RETRY_INTERVAL_MS) {
        return false;
    }
    last_attempt_ = now;
    return create();
}

void UinputPad::destroy() {
    int fd = fd_.exchange(-1);
    if (fd < 0) {
        return;
    }
    ioctl(fd, UI_DEV_DESTROY);
    ::close(fd);
    std::cout << "Virtual controller removed" << std::endl;
}

SinkError UinputPad::submit(const PadReport& report) {
    const int fd = fd_.load();
    if (fd < 0) {
        return SinkError::NotReady;
    }

    std::vector<struct input_event> events;
    events.reserve(24);

    for (const auto& binding : KEY_BINDINGS) {
        bool pressed = (report.buttons & static_cast<uint16_t>(binding.button)) != 0;
        push_event(events, EV_KEY, binding.code, pressed ? 1 : 0);
    }

    push_event(events, EV_ABS, ABS_X, report.thumb_lx);
    push_event(events, EV_ABS, ABS_Y, invert_axis(report.thumb_ly));
    push_event(events, EV_ABS, ABS_RX, report.thumb_rx);
    push_event(events, EV_ABS, ABS_RY, invert_axis(report.thumb_ry));
    push_event(events, EV_ABS, ABS_Z, report.left_trigger);
    push_event(events, EV_ABS, ABS_RZ, report.right_trigger);
    push_event(events, EV_ABS, ABS_HAT0X, hat_value(report.buttons, Button::DpadLeft, Button::DpadRight));
    push_event(events, EV_ABS, ABS_HAT0Y, hat_value(report.buttons, Button::DpadUp, Button::DpadDown));
    push_event(events, EV_SYN, SYN_REPORT, 0);

    const size_t bytes = events.size() * sizeof(struct input_event);
    ssize_t written;
    do {
        written = write(fd, events.data(), bytes);
    } while (written < 0 && errno == EINTR);

    if (written != static_cast<ssize_t>(bytes)) {
        std::cerr << "uinput write: " << (written < 0 ? std::strerror(errno) : "short write") << std::endl;
        return SinkError::WriteFailure;
    }
    return SinkError::None;
}

}  // namespace deck_relay
