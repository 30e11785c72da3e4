#pragma once
/**
 * @page pb-encoders Pixel Display Encoders
 * @file encoders.hpp
 * @brief Byte builders for the pixel-matrix display's command characteristic.
 *
 * @details
 * PURPOSE
 * -------
 * Every operation the display understands is one (or a run of) binary frames
 * written to characteristic 0000fa02-.... The functions here produce those
 * frames from already-typed values. They do no string parsing and no range
 * checking beyond what the wire format itself forces; that is the registry's
 * job (see command_registry.hpp), which validates arguments against each
 * command's schema before calling in here.
 *
 * FRAME LAYOUT
 * ------------
 * Short commands:
 * @code
 *   [len_lo][len_hi][cmd][sub][payload ...]      len = total bytes, little-endian
 * @endcode
 * e.g. clear is `04 00 03 80`, brightness 80 is `05 00 04 80 50`.
 *
 * Uploads (text, animation) cut the body into windows of at most
 * UPLOAD_CHUNK bytes. Each window is one frame:
 * @code
 *   [len_lo][len_hi][kind][00][flag][total u32 LE][crc32 u32 LE][slot][chunk ...]
 * @endcode
 * flag is 0x00 on the first window and 0x02 on continuation windows.
 * total/crc32 always describe the whole body. All windows are returned
 * concatenated; the link layer splits them again to fit the ATT MTU.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - command_registry.hpp: the only caller. Holds the name → schema → builder
 *   table exposed to clients.
 * - device_session.hpp: ships whatever bytes come out of here.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace pixelbridge {

using Bytes = std::vector<uint8_t>;

struct Rgb {
    uint8_t r{0xFF};
    uint8_t g{0xFF};
    uint8_t b{0xFF};
};

struct CalendarDate {
    int year{2000};
    int month{1};   // 1..12
    int day{1};     // 1..31
};

// Upload window size in body bytes.
constexpr std::size_t UPLOAD_CHUNK = 4096;

// Upload kinds (byte [2] of an upload frame).
constexpr uint8_t UPLOAD_TEXT      = 0x01;
constexpr uint8_t UPLOAD_ANIMATION = 0x03;

/// 1 = Monday .. 7 = Sunday. Gregorian, valid for any year > 1752.
int weekday_of(const CalendarDate& d);

/// CRC-32 (ISO-HDLC / zlib polynomial) of the whole body.
uint32_t body_crc32(const Bytes& body);

Bytes make_clear();
Bytes make_set_brightness(uint8_t brightness);
Bytes make_set_orientation(uint8_t orientation);
Bytes make_set_fun_mode(bool enable);
Bytes make_set_speed(uint8_t speed);
Bytes make_set_pixel(uint8_t x, uint8_t y, const Rgb& color);
Bytes make_set_clock_mode(uint8_t style, bool show_date, bool format_24, const CalendarDate& date);
Bytes make_set_screen(uint8_t screen);
Bytes make_delete_screen(uint8_t screen);

/**
 * @brief Text upload.
 * Body: [r][g][b][animation][speed][rainbow_mode][utf-8 text ...]
 */
Bytes make_send_text(const std::string& text, const Rgb& color, uint8_t animation,
                     uint8_t speed, uint8_t rainbow_mode, uint8_t save_slot);

/// GIF upload. @p gif is the raw file content.
Bytes make_send_animation(const Bytes& gif, uint8_t save_slot);

/// Shared upload framing; see file comment.
Bytes make_upload_frames(uint8_t kind, uint8_t save_slot, const Bytes& body);

/// Lowercase hex dump, no separators. Used in debug logs.
std::string to_hex(const Bytes& b);

} // namespace pixelbridge
