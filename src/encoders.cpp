#include "pixelbridge/encoders.hpp"   // builders, Rgb, CalendarDate, upload constants

#include "etl/crc32.h"                 // etl::crc32 for upload checksums

#include <algorithm>                   // std::min for chunk slicing

namespace pixelbridge {
// ============================================================================
// Low-level helpers
// ============================================================================
// Short frames are all built the same way: header with a length placeholder,
// payload bytes, then the placeholder is backfilled.

// ---------------------------------------------------------------------------
// Start a frame: [len_lo][len_hi][cmd][sub], length filled by finalize().
// ---------------------------------------------------------------------------
static inline Bytes header(uint8_t cmd, uint8_t sub) {
    Bytes b;
    b.reserve(16);
    b.push_back(0);                    // len lo (filled later)
    b.push_back(0);                    // len hi
    b.push_back(cmd);
    b.push_back(sub);
    return b;
}

static inline void put_u32(Bytes& b, uint32_t v) {
    b.push_back((uint8_t)(v & 0xFF));
    b.push_back((uint8_t)((v >> 8) & 0xFF));
    b.push_back((uint8_t)((v >> 16) & 0xFF));
    b.push_back((uint8_t)((v >> 24) & 0xFF));
}

static inline void put_rgb(Bytes& b, const Rgb& c) {
    b.push_back(c.r);
    b.push_back(c.g);
    b.push_back(c.b);
}

// ---------------------------------------------------------------------------
// Backfill total length at [0..1]. The device rejects frames whose length
// field disagrees with what it received.
// ---------------------------------------------------------------------------
static inline void finalize(Bytes& b) {
    const auto n = static_cast<uint16_t>(b.size());
    b[0] = (uint8_t)(n & 0xFF);
    b[1] = (uint8_t)(n >> 8);
}

static inline Bytes single_byte(uint8_t cmd, uint8_t sub, uint8_t v) {
    auto b = header(cmd, sub);
    b.push_back(v);
    finalize(b);
    return b;
}

// ============================================================================
// Misc
// ============================================================================

// Sakamoto's method; returns 0 = Sunday, remapped to ISO 1..7.
int weekday_of(const CalendarDate& d) {
    static const int t[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    int y = d.year;
    if (d.month < 3) y -= 1;
    const int w = (y + y / 4 - y / 100 + y / 400 + t[(d.month - 1) % 12] + d.day) % 7;
    return w == 0 ? 7 : w;
}

uint32_t body_crc32(const Bytes& body) {
    etl::crc32 crc(body.begin(), body.end());
    return crc.value();
}

std::string to_hex(const Bytes& b) {
    static const char* digits = "0123456789abcdef";
    std::string s;
    s.reserve(b.size() * 2);
    for (uint8_t v : b) {
        s.push_back(digits[v >> 4]);
        s.push_back(digits[v & 0x0F]);
    }
    return s;
}

// ============================================================================
// Display settings
// ============================================================================

Bytes make_clear() {
    auto b = header(0x03, 0x80);
    finalize(b);
    return b;
}

Bytes make_set_brightness(uint8_t brightness) { return single_byte(0x04, 0x80, brightness); }
Bytes make_set_orientation(uint8_t orientation) { return single_byte(0x06, 0x80, orientation); }
Bytes make_set_fun_mode(bool enable) { return single_byte(0x04, 0x01, enable ? 1 : 0); }
Bytes make_set_speed(uint8_t speed) { return single_byte(0x03, 0x01, speed); }

// DIY mode pixel: [00][r][g][b][x][y]
Bytes make_set_pixel(uint8_t x, uint8_t y, const Rgb& color) {
    auto b = header(0x05, 0x01);
    b.push_back(0x00);
    put_rgb(b, color);
    b.push_back(x);
    b.push_back(y);
    finalize(b);
    return b;
}

Bytes make_set_clock_mode(uint8_t style, bool show_date, bool format_24, const CalendarDate& date) {
    auto b = header(0x06, 0x01);
    b.push_back(style);
    b.push_back(format_24 ? 1 : 0);
    b.push_back(show_date ? 1 : 0);
    b.push_back((uint8_t)(date.year % 100));
    b.push_back((uint8_t)date.month);
    b.push_back((uint8_t)date.day);
    b.push_back((uint8_t)weekday_of(date));
    finalize(b);
    return b;
}

// Saved screens (slots). [01][00][slot]
Bytes make_set_screen(uint8_t screen) {
    auto b = header(0x07, 0x80);
    b.push_back(0x01);
    b.push_back(0x00);
    b.push_back(screen);
    finalize(b);
    return b;
}

Bytes make_delete_screen(uint8_t screen) {
    auto b = header(0x02, 0x01);
    b.push_back(0x01);
    b.push_back(0x00);
    b.push_back(screen);
    finalize(b);
    return b;
}

// ============================================================================
// Uploads
// ============================================================================

Bytes make_upload_frames(uint8_t kind, uint8_t save_slot, const Bytes& body) {
    const auto total = static_cast<uint32_t>(body.size());
    const uint32_t crc = body_crc32(body);

    Bytes out;
    out.reserve(body.size() + (body.size() / UPLOAD_CHUNK + 1) * 14);

    std::size_t off = 0;
    bool first = true;
    do {
        const std::size_t n = std::min(UPLOAD_CHUNK, body.size() - off);

        auto f = header(kind, 0x00);
        f.push_back(first ? 0x00 : 0x02);
        put_u32(f, total);
        put_u32(f, crc);
        f.push_back(save_slot);
        f.insert(f.end(), body.begin() + off, body.begin() + off + n);
        finalize(f);

        out.insert(out.end(), f.begin(), f.end());
        off += n;
        first = false;
    } while (off < body.size());

    return out;
}

Bytes make_send_text(const std::string& text, const Rgb& color, uint8_t animation,
                     uint8_t speed, uint8_t rainbow_mode, uint8_t save_slot) {
    Bytes body;
    body.reserve(6 + text.size());
    put_rgb(body, color);
    body.push_back(animation);
    body.push_back(speed);
    body.push_back(rainbow_mode);
    body.insert(body.end(), text.begin(), text.end());
    return make_upload_frames(UPLOAD_TEXT, save_slot, body);
}

Bytes make_send_animation(const Bytes& gif, uint8_t save_slot) {
    return make_upload_frames(UPLOAD_ANIMATION, save_slot, gif);
}

} // namespace pixelbridge
