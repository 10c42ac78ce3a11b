#include "usb.h"

#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

static std::string usb_error(int r) {
    return libusb_strerror(static_cast<libusb_error>(r));
}

UsbLedController::UsbLedController() {
    int r = libusb_init(&_ctx);
    if (r < 0) {
        throw std::runtime_error(std::string("libusb_init failed: ") + usb_error(r));
    }
}

UsbLedController::~UsbLedController() {
    close();
    if (_ctx) {
        libusb_exit(_ctx);
        _ctx = nullptr;
    }
}

void UsbLedController::open(uint16_t vid, uint16_t pid) {
    _handle = libusb_open_device_with_vid_pid(_ctx, vid, pid);
    if (!_handle) {
        std::ostringstream ss;
        ss << std::hex << std::setw(4) << std::setfill('0') << vid
           << ":" << std::setw(4) << std::setfill('0') << pid;
        throw std::runtime_error(
            "Could not find or open device " + ss.str() +
            ", is the controller plugged in? Try running with sudo or install the udev rule.");
    }

    try {
        _claim_interface(NZXT_INTERFACE, _detached);
    } catch (const std::runtime_error&) {
        libusb_close(_handle);
        _handle = nullptr;
        throw;
    }
}

void UsbLedController::close() {
    if (!_handle) return;

    _release_interface(NZXT_INTERFACE, _detached);
    _detached = false;

    libusb_close(_handle);
    _handle = nullptr;
}

void UsbLedController::send(const Frame& frame) {
    if (!_handle)
        throw std::runtime_error("send on a closed device");

    // libusb wants a non-const buffer even for OUT transfers
    uint8_t buf[NZXT_FRAME_SIZE];
    std::memcpy(buf, frame.data(), NZXT_FRAME_SIZE);

    int transferred = 0;
    int r = libusb_interrupt_transfer(
        _handle,
        INTERRUPT_EP_OUT,
        buf,
        NZXT_FRAME_SIZE,
        &transferred,
        USB_TIMEOUT_MS);

    if (r < 0) {
        throw std::runtime_error(
            std::string("Interrupt transfer (send) failed: ") + usb_error(r));
    }
    if (transferred != NZXT_FRAME_SIZE) {
        throw std::runtime_error(
            "Incomplete send: wrote " + std::to_string(transferred) +
            " bytes, expected " + std::to_string(NZXT_FRAME_SIZE));
    }
}

void UsbLedController::send_frames(const FramePair& frames, unsigned int delay_ms) {
    send(frames.frame1);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    send(frames.frame2);
}

void UsbLedController::probe() {
    if (!_handle)
        throw std::runtime_error("probe on a closed device");

    libusb_device* dev = libusb_get_device(_handle);
    libusb_config_descriptor* cfg = nullptr;

    if (libusb_get_active_config_descriptor(dev, &cfg) < 0) {
        std::cout << "Could not get config descriptor\n";
        return;
    }

    std::cout << "USB descriptor: " << static_cast<int>(cfg->bNumInterfaces)
              << " interface(s)\n";

    for (int i = 0; i < cfg->bNumInterfaces; ++i) {
        const auto& iface = cfg->interface[i];
        for (int a = 0; a < iface.num_altsetting; ++a) {
            const auto& alt = iface.altsetting[a];
            std::cout << "  Interface " << static_cast<int>(alt.bInterfaceNumber)
                      << " (class " << static_cast<int>(alt.bInterfaceClass)
                      << ")  endpoints: " << static_cast<int>(alt.bNumEndpoints) << "\n";
            for (int e = 0; e < alt.bNumEndpoints; ++e) {
                const auto& ep = alt.endpoint[e];
                uint8_t addr = ep.bEndpointAddress;
                std::string dir = (addr & 0x80) ? "IN " : "OUT";
                std::string type;
                switch (ep.bmAttributes & 0x03) {
                    case 0: type = "Control";     break;
                    case 1: type = "Isochronous"; break;
                    case 2: type = "Bulk";        break;
                    case 3: type = "Interrupt";   break;
                }
                std::cout << std::hex << std::setfill('0');
                std::cout << "    EP 0x" << std::setw(2) << static_cast<int>(addr)
                          << "  " << dir << "  " << type
                          << "  maxPacket=" << std::dec << ep.wMaxPacketSize << "\n";
            }
        }
    }

    libusb_free_config_descriptor(cfg);
}

// --- private helpers ---

void UsbLedController::_claim_interface(int iface, bool& detached_flag) {
    detached_flag = false;

    if (libusb_kernel_driver_active(_handle, iface) == 1) {
        int r = libusb_detach_kernel_driver(_handle, iface);
        if (r < 0) {
            throw std::runtime_error(
                "Failed to detach kernel driver from interface " +
                std::to_string(iface) + ": " + usb_error(r));
        }
        detached_flag = true;
    }

    int r = libusb_claim_interface(_handle, iface);
    if (r < 0) {
        if (detached_flag && libusb_attach_kernel_driver(_handle, iface) < 0)
            std::cerr << "Warning: could not reattach kernel driver to interface "
                      << iface << "\n";
        throw std::runtime_error(
            "Failed to claim interface " + std::to_string(iface) + ": " + usb_error(r));
    }
}

// Called from close() and the destructor, so failures are reported
// rather than thrown.
void UsbLedController::_release_interface(int iface, bool detached_flag) {
    int r = libusb_release_interface(_handle, iface);
    if (r < 0)
        std::cerr << "Warning: failed to release interface " << iface
                  << ": " << usb_error(r) << "\n";
    if (detached_flag) {
        r = libusb_attach_kernel_driver(_handle, iface);
        if (r < 0)
            std::cerr << "Warning: failed to reattach kernel driver to interface "
                      << iface << ": " << usb_error(r) << "\n";
    }
}
