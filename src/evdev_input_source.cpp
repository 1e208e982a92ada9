/*
 * Evdev Input Source Implementation
 */

#include "evdev_input_source.hpp"

#include <linux/input-event-codes.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

namespace deck_relay {

namespace {

const unsigned RESCAN_INTERVAL_SEC = 5;

// Unprofiled devices are taken if they look like a gamepad
bool is_generic_gamepad(struct libevdev* dev) {
    return libevdev_has_event_type(dev, EV_KEY) && libevdev_has_event_type(dev, EV_ABS) &&
           (libevdev_has_event_code(dev, EV_KEY, BTN_GAMEPAD) ||
            libevdev_has_event_code(dev, EV_KEY, BTN_SOUTH));
}

std::vector<std::string> list_event_nodes(const std::string& input_dir) {
    std::vector<std::string> event_paths;
    DIR* dir = opendir(input_dir.c_str());
    if (!dir) {
        std::cerr << "opendir " << input_dir << ": " << std::strerror(errno) << std::endl;
        return event_paths;
    }

    struct dirent* ent;
    while ((ent = readdir(dir)) != nullptr) {
        if (std::string(ent->d_name).compare(0, 5, "event") != 0) continue;
        event_paths.push_back(input_dir + "/" + ent->d_name);
    }
    closedir(dir);

    std::sort(event_paths.begin(), event_paths.end());
    return event_paths;
}

}  // namespace

EvdevInputSource::EvdevInputSource(std::string profile_dir, std::string input_dir)
    : profiles_(std::move(profile_dir)), input_dir_(std::move(input_dir)) {
}

EvdevInputSource::~EvdevInputSource() {
    closeDevice();
}

bool EvdevInputSource::rescan() {
    last_rescan_ = time(nullptr);

    for (const auto& path : list_event_nodes(input_dir_)) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) continue;

        struct libevdev* dev = nullptr;
        int rc = libevdev_new_from_fd(fd, &dev);
        if (rc < 0) {
            close(fd);
            continue;
        }

        const char* raw_name = libevdev_get_name(dev);
        std::string name = raw_name ? raw_name : path;
        auto profile = profiles_.find(name);
        if (!profile && !is_generic_gamepad(dev)) {
            libevdev_free(dev);
            close(fd);
            continue;
        }

        if (libevdev_grab(dev, LIBEVDEV_GRAB) != 0) {
            std::cerr << "Warning: could not grab " << path
                      << " (another process may have it). Events may not appear." << std::endl;
        }

        ControllerHandle handle;
        handle.fd = fd;
        handle.path = path;
        handle.name = name;
        handle.dev = dev;
        handle.profile = profile;
        device_ = GamepadDevice::create(std::move(handle));

        std::cout << "Controller: " << name << " (" << path << ")";
        if (profile) {
            std::cout << " [profile: " << profile->name() << "]";
        } else {
            std::cout << " [generic mapping]";
        }
        std::cout << std::endl;

        std::lock_guard<std::mutex> lock(names_mutex_);
        names_ = {name};
        return true;
    }
    return false;
}

void EvdevInputSource::closeDevice() {
    if (device_) {
        std::cout << "Controller removed: " << device_->getName() << std::endl;
    }
    device_.reset();
    std::lock_guard<std::mutex> lock(names_mutex_);
    names_.clear();
}

void EvdevInputSource::drainEvents() {
    struct input_event ev;
    unsigned flags = LIBEVDEV_READ_FLAG_NORMAL;
    for (;;) {
        int rc = libevdev_next_event(device_->getDevice(), flags, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            device_->processEvent(ev);
        } else if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Events were dropped; libevdev replays the missing deltas in sync mode
            flags = LIBEVDEV_READ_FLAG_SYNC;
            if (ev.type != EV_SYN) {
                device_->processEvent(ev);
            }
        } else if (rc == -EAGAIN) {
            if (flags == LIBEVDEV_READ_FLAG_SYNC) {
                flags = LIBEVDEV_READ_FLAG_NORMAL;
                continue;
            }
            return;
        } else {
            if (rc != -ENODEV) {
                std::cerr << "evdev read " << device_->getPath() << ": " << std::strerror(-rc) << std::endl;
            }
            closeDevice();
            return;
        }
    }
}

bool EvdevInputSource::readState(RawInput& out) {
    if (!device_) {
        time_t now = time(nullptr);
        if (now - last_rescan_ < static_cast<time_t>(RESCAN_INTERVAL_SEC) || !rescan()) {
            return false;
        }
    }

    drainEvents();
    if (!device_) {
        return false;
    }
    out = device_->state();
    return true;
}

std::vector<std::string> EvdevInputSource::controllerNames() const {
    std::lock_guard<std::mutex> lock(names_mutex_);
    return names_;
}

}  // namespace deck_relay
