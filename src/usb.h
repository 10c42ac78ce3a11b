#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <libusb.h>

#include "config.h"
#include "protocol.h"

// The LED controller lives on interface 0 and takes frames on the
// interrupt OUT endpoint.
static constexpr int     NZXT_INTERFACE     = 0;
static constexpr uint8_t INTERRUPT_EP_OUT   = 0x01;

// Timeout for USB transfers in milliseconds
static constexpr unsigned int USB_TIMEOUT_MS = 1000;

class UsbLedController {
public:
    UsbLedController();
    ~UsbLedController();

    // Non-copyable
    UsbLedController(const UsbLedController&) = delete;
    UsbLedController& operator=(const UsbLedController&) = delete;

    // Open the controller by VID/PID (detaches kernel driver automatically)
    void open(uint16_t vid = NZXT_VID, uint16_t pid = NZXT_PID);

    // Release the interface and reattach the kernel driver
    void close();

    // Write one 65-byte frame to the controller
    // Throws std::runtime_error on failure
    void send(const Frame& frame);

    // Write frame 1, wait delay_ms, write frame 2. No retry: a failed
    // write throws and the second frame is not sent.
    void send_frames(const FramePair& frames, unsigned int delay_ms = NZXT_FRAME_DELAY_MS);

    // Print all USB interfaces and endpoints for this device to stdout.
    void probe();

private:
    libusb_context*       _ctx    = nullptr;
    libusb_device_handle* _handle = nullptr;

    bool _detached = false;

    void _claim_interface(int iface, bool& detached_flag);
    void _release_interface(int iface, bool detached_flag);
};
